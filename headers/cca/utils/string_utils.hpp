//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CCA_STRING_UTILS_HPP
#define CCA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief Line and token helpers shared by the analyzers and the store layer.
 *
 * Analyzers look at one source line at a time, so most helpers take and
 * return string_view slices of the submitted text.
 */

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace cca::string_utils {

    inline constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

    inline char fold(const char c) noexcept {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    inline std::string_view trim_left(const std::string_view s) noexcept {
        const auto first = s.find_first_not_of(WHITESPACE);
        return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    }

    inline std::string_view trim_right(const std::string_view s) noexcept {
        const auto last = s.find_last_not_of(WHITESPACE);
        return last == std::string_view::npos ? std::string_view{} : s.substr(0, last + 1);
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_right(trim_left(s));
    }

    /**
     * Cuts @p s at every @p delimiter. Empty pieces are kept, so a text of
     * N newlines always gives N + 1 lines and line numbers stay exact.
     */
    inline std::vector<std::string_view> split(const std::string_view s, const char delimiter) {
        std::vector<std::string_view> pieces;
        std::string_view rest = s;
        for (auto cut = rest.find(delimiter); cut != std::string_view::npos; cut = rest.find(delimiter)) {
            pieces.push_back(rest.substr(0, cut));
            rest.remove_prefix(cut + 1);
        }
        pieces.push_back(rest);
        return pieces;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.starts_with(prefix);
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string lowered;
        lowered.reserve(s.size());
        std::ranges::transform(s, std::back_inserter(lowered), fold);
        return lowered;
    }

    inline bool equals_ignore_case(const std::string_view a, const std::string_view b) noexcept {
        return std::ranges::equal(a, b, {}, fold, fold);
    }

    /**
     * Longest prefix of @p s no wider than @p max_bytes that does not end
     * inside a UTF-8 sequence. Bytes that are not UTF-8 pass through.
     */
    inline std::string_view utf8_prefix(const std::string_view s, const std::size_t max_bytes) noexcept {
        if (s.size() <= max_bytes) {
            return s;
        }
        std::size_t cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        return s.substr(0, cut);
    }

    /// Indentation width in characters; a tab counts as one.
    inline std::size_t leading_whitespace(const std::string_view s) noexcept {
        return s.size() - trim_left(s).size();
    }

}  // namespace cca::string_utils

#endif //CCA_STRING_UTILS_HPP

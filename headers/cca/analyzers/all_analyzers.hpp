//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef CCA_ALL_ANALYZERS_HPP
#define CCA_ALL_ANALYZERS_HPP

/**
 * @file all_analyzers.hpp
 * @brief Includes all analyzers and creates them by category.
 */

#include "cca/analyzers/security_analyzer.hpp"
#include "cca/analyzers/quality_analyzer.hpp"
#include "cca/analyzers/performance_analyzer.hpp"
#include "cca/analyzers/best_practices_analyzer.hpp"

namespace cca::analyzers {

    /**
     * Creates the analyzer of a category, bound to store.
     */
    [[nodiscard]] AnalyzerPtr make_analyzer(Category category, storage::StorePtr store);

}  // namespace cca::analyzers

#endif //CCA_ALL_ANALYZERS_HPP

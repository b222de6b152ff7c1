//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CCA_VERSION_HPP
#define CCA_VERSION_HPP

namespace cca {

    // Keep in sync with project(VERSION) in CMakeLists.txt.
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Code Cleanup Analyzer";

    /// Executable name, used in usage lines and help hints.
    constexpr auto PROJECT_SHORT_NAME = "cca";

}  // namespace cca

#endif //CCA_VERSION_HPP

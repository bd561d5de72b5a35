#ifndef CCA_VERSION_HPP
#define CCA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Circuit Cost Analyzer version information.
 */

namespace cca {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    /**
     * Version of the JSON schema written by the exporters.
     */
    constexpr auto SCHEMA_VERSION = "1.0.0";

    constexpr auto PROJECT_NAME = "Circuit Cost Analyzer";
    constexpr auto PROJECT_SHORT_NAME = "cca";

}  // namespace cca

#endif //CCA_VERSION_HPP

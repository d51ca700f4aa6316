#ifndef CKG_VERSION_HPP
#define CKG_VERSION_HPP

/**
 * @file version.hpp
 * @brief Code Knowledge Graph version information.
 */

namespace ckg {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     * Written into every exported snapshot.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Code Knowledge Graph";

    constexpr auto PROJECT_SHORT_NAME = "ckg";

}  // namespace ckg

#endif //CKG_VERSION_HPP

/**
 * @file version.h
 * @brief Library version information
 */

#ifndef KCENON_FILE_DELIVERY_CORE_VERSION_H
#define KCENON_FILE_DELIVERY_CORE_VERSION_H

#include <string>

namespace kcenon::file_delivery {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /// Product name sent in the User-Agent header
    static constexpr const char* product = "file-delivery-agent";

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_delivery

#endif  // KCENON_FILE_DELIVERY_CORE_VERSION_H

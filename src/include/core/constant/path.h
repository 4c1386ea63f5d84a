#pragma once

#include <cstdlib>
#include <filesystem>

namespace lanbeam::core {
namespace path {

inline std::filesystem::path EnvDir(const char* name) {
    if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
        return std::filesystem::path(value);
    }
    return std::filesystem::temp_directory_path();
}

inline const std::filesystem::path kCertificateDir =
#if defined(_WIN32) || defined(_WIN64)
    EnvDir("APPDATA") / "lanbeam" / "certificates";
#elif defined(__APPLE__)
    EnvDir("HOME") / "Library" / "Application Support" / "lanbeam" / "certificates";
#else
    EnvDir("HOME") / ".local" / "share" / "lanbeam" / "certificates";
#endif

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "lanbeam"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    EnvDir("APPDATA") / "lanbeam";
#else
    EnvDir("HOME") / ".config" / "lanbeam";
#endif

inline const std::filesystem::path kSystemDownloadDir =
#if defined(_WIN32) || defined(_WIN64)
    EnvDir("USERPROFILE") / "Downloads";
#else
    EnvDir("HOME") / "Downloads";
#endif

} // namespace path
} // namespace lanbeam::core

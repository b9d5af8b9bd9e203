#pragma once

#include <cstdlib>
#include <filesystem>

namespace landrop::core {
namespace path {

namespace details {

inline std::filesystem::path HomeDir() {
#if defined(_WIN32) || defined(_WIN64)
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home ? std::filesystem::path(home) : std::filesystem::temp_directory_path();
}

} // namespace details

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "LanDrop"
                                             / "logs";

inline const std::filesystem::path kConfigDir =
#if defined(_WIN32) || defined(_WIN64)
    std::filesystem::path(std::getenv("APPDATA")) / "LanDrop";
#elif defined(__APPLE__)
    details::HomeDir() / "Library" / "Application Support" / "LanDrop";
#else
    details::HomeDir() / ".config" / "LanDrop";
#endif

inline const std::filesystem::path kDefaultSaveDir = details::HomeDir() / "Downloads" / "LanDrop";

} // namespace path
} // namespace landrop::core

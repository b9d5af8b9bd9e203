#include <boost/asio/ip/host_name.hpp>
#include <core/util/system.h>
#include <spdlog/spdlog.h>
#include <string>

namespace landrop::core {

namespace system {

std::string Hostname() {
    std::string hostname;
    try {
        hostname = boost::asio::ip::host_name();
    } catch (const std::exception& e) {
        spdlog::error("Failed to get host name: {}", e.what());
        return "LanDrop Device";
    }
    if (hostname.ends_with(".local")) {
        hostname = hostname.substr(0, hostname.size() - 6);
    } else if (hostname.ends_with(".localdomain")) {
        hostname = hostname.substr(0, hostname.size() - 12);
    }
    return hostname.empty() ? "LanDrop Device" : hostname;
}

std::string PlatformTag() {
#if defined(__APPLE__) || defined(__MACH__)
    return "darwin";
#elif defined(__ANDROID__)
    return "android";
#elif defined(__linux__)
    return "linux";
#elif defined(_WIN32) || defined(_WIN64)
    return "win32";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

} // namespace system

} // namespace landrop::core

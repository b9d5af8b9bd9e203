#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace landrop::core {

enum class DeviceType {
    kDesktop,
    kMobile,
    kTablet,
};

NLOHMANN_JSON_SERIALIZE_ENUM(DeviceType,
                             {
                                 {DeviceType::kDesktop, "desktop"},
                                 {DeviceType::kMobile, "mobile"},
                                 {DeviceType::kTablet, "tablet"},
                             });

// "darwin", "win32" and "linux" are desktops, every other tag is treated as mobile
DeviceType ClassifyPlatform(std::string_view platform);

struct DeviceInfo {
    std::string device_id;   // 唯一ID, stable across restarts
    std::string device_name; // 显示名称, defaults to the host name
    std::string platform;    // platform tag, e.g. "linux"
    DeviceType device_type = DeviceType::kDesktop;
    std::string ip_address;  // transport-observed source address
    std::uint16_t port = 0;  // transfer port
    bool online = true;
    std::chrono::steady_clock::time_point last_seen{};
};

// last_seen is process-local and never serialized
void to_json(nlohmann::json& j, const DeviceInfo& device);
void from_json(const nlohmann::json& j, DeviceInfo& device);

} // namespace landrop::core

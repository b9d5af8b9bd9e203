#include <core/model/device_info.h>

namespace landrop::core {

DeviceType ClassifyPlatform(std::string_view platform) {
    if (platform == "darwin" || platform == "win32" || platform == "linux") {
        return DeviceType::kDesktop;
    }
    return DeviceType::kMobile;
}

void to_json(nlohmann::json& j, const DeviceInfo& device) {
    j = nlohmann::json{
        {"id", device.device_id},
        {"name", device.device_name},
        {"platform", device.platform},
        {"type", device.device_type},
        {"ip", device.ip_address},
        {"port", device.port},
        {"online", device.online},
    };
}

void from_json(const nlohmann::json& j, DeviceInfo& device) {
    j.at("id").get_to(device.device_id);
    j.at("name").get_to(device.device_name);
    device.platform = j.value("platform", "");
    device.device_type = j.value("type", ClassifyPlatform(device.platform));
    j.at("ip").get_to(device.ip_address);
    j.at("port").get_to(device.port);
    device.online = j.value("online", true);
}

} // namespace landrop::core

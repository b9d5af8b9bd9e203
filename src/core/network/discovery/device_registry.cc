#include <core/network/discovery/device_registry.h>
#include <spdlog/spdlog.h>

namespace landrop::core {

DeviceRegistry::DeviceRegistry(Clock::duration staleness_window)
    : staleness_window_(staleness_window) {}

bool DeviceRegistry::Upsert(const AnnounceDto& announce,
                            std::string_view source_address,
                            Clock::time_point now) {
    auto [it, inserted] = devices_.try_emplace(announce.device_id);
    auto& device = it->second;
    bool newly_seen = inserted || !device.online;

    device.device_id = announce.device_id;
    device.device_name = announce.device_name;
    device.platform = announce.platform;
    device.device_type = ClassifyPlatform(announce.platform);
    device.ip_address = std::string(source_address);
    device.port = announce.transfer_port;
    device.online = true;
    device.last_seen = now;

    if (newly_seen) {
        spdlog::debug("Registry: {} ({}) is online at {}:{}",
                      device.device_name,
                      device.device_id,
                      device.ip_address,
                      device.port);
    }
    return newly_seen;
}

std::vector<DeviceInfo> DeviceRegistry::Sweep(Clock::time_point now) {
    std::vector<DeviceInfo> offline;
    for (auto& [id, device] : devices_) {
        if (device.online && now - device.last_seen > staleness_window_) {
            device.online = false;
            offline.push_back(device);
            spdlog::debug("Registry: {} ({}) went offline", device.device_name, id);
        }
    }
    return offline;
}

std::vector<DeviceInfo> DeviceRegistry::List() const {
    std::vector<DeviceInfo> devices;
    for (const auto& [id, device] : devices_) {
        if (device.online) {
            devices.push_back(device);
        }
    }
    return devices;
}

std::optional<DeviceInfo> DeviceRegistry::Get(std::string_view device_id) const {
    auto it = devices_.find(std::string(device_id));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace landrop::core

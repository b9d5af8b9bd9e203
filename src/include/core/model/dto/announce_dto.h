#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace landrop::core {

// One discovery datagram: {kind:"announce", deviceId, deviceName, platform, transferPort, timestamp}
struct AnnounceDto {
    static constexpr const char* kKind = "announce";

    std::string device_id;
    std::string device_name;
    std::string platform;
    std::uint16_t transfer_port = 0;
    std::int64_t timestamp = 0; // sender clock, milliseconds since epoch
};

inline void to_json(nlohmann::json& j, const AnnounceDto& dto) {
    j = nlohmann::json{
        {"kind", AnnounceDto::kKind},
        {"deviceId", dto.device_id},
        {"deviceName", dto.device_name},
        {"platform", dto.platform},
        {"transferPort", dto.transfer_port},
        {"timestamp", dto.timestamp},
    };
}

inline void from_json(const nlohmann::json& j, AnnounceDto& dto) {
    if (j.at("kind").get<std::string>() != AnnounceDto::kKind) {
        throw std::invalid_argument("not an announce record");
    }
    j.at("deviceId").get_to(dto.device_id);
    j.at("deviceName").get_to(dto.device_name);
    j.at("platform").get_to(dto.platform);
    auto port = j.at("transferPort").get<std::int64_t>();
    if (port < 1 || port > 65535) {
        throw std::out_of_range("transferPort out of range");
    }
    dto.transfer_port = static_cast<std::uint16_t>(port);
    j.at("timestamp").get_to(dto.timestamp);
    if (dto.device_id.empty()) {
        throw std::invalid_argument("empty deviceId");
    }
}

} // namespace landrop::core

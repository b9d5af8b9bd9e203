#pragma once

#include "core/util/config.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct Settings {
    std::string device_id;
    std::string device_name;
    std::uint16_t transfer_port;
    bool auto_receive;
    std::string save_dir;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        Settings, device_id, device_name, transfer_port, auto_receive, save_dir);

    static Settings FromConfigSettings(const core::Settings& settings) {
        return Settings{
            .device_id = settings.device_id,
            .device_name = settings.device_name,
            .transfer_port = settings.transfer_port,
            .auto_receive = settings.auto_receive,
            .save_dir = settings.save_dir.string(),
        };
    }
};

} // namespace landrop::core::feedback

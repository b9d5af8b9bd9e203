/*
    config.h
    This header provides functionality for managing application configuration
    using TOML files. It includes utilities for reading and writing general
    configuration values as well as specific application settings.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = landrop::core::config["key"].value_or(default_value);

    Application settings:
    - Read a setting:
        std::string name = landrop::core::settings.device_name;
        std::uint16_t port = landrop::core::settings.transfer_port;
        bool auto_receive = landrop::core::settings.auto_receive;
        std::filesystem::path save_dir = landrop::core::settings.save_dir;
    - Write a setting:
        landrop::core::settings.device_name = "new name";
        landrop::core::settings.save_dir = "/path/to/save";

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        landrop::core::InitConfig();
    - Save the current configuration to file:
        landrop::core::SaveConfig();

    The device id is generated on the first run and written back immediately,
    it must never change afterwards.
*/

#pragma once

#include <core/constant/path.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace landrop::core {

inline toml::table config;

struct Settings {
    std::string device_id;
    std::string device_name;          // Display name
    std::uint16_t discovery_port;     // UDP broadcast port
    std::uint16_t transfer_port;      // TCP transfer port
    bool auto_receive;                // Whether to accept transfer requests without asking
    std::filesystem::path save_dir;   // Destination root for received files
    std::uint32_t announce_interval_ms;
    std::uint32_t staleness_window_ms;
    std::uint32_t sweep_interval_ms;
    std::uint32_t confirm_timeout_s;
};

inline Settings settings;

void InitConfig(const std::filesystem::path& config_dir = path::kConfigDir);

void SaveConfig(const std::filesystem::path& config_dir = path::kConfigDir);

} // namespace landrop::core

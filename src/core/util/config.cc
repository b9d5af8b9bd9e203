#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <core/util/system.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace landrop::core {

namespace {

constexpr const char* kConfigFileName = "config.toml";

template<typename T>
T readInteger(const toml::table& setting, std::string_view key, T default_value, T min_value = 0) {
    auto value = setting[key].value<std::int64_t>();
    if (!value) {
        return default_value;
    }
    if (*value < static_cast<std::int64_t>(min_value)
        || *value > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
        spdlog::warn("{} = {} is out of range, using {}", key, *value, default_value);
        return default_value;
    }
    return static_cast<T>(*value);
}

} // namespace

static void LoadSetting() {
    if (!config.contains("setting")) {
        config.insert("setting", toml::table{});
    }
    auto& setting = *config["setting"].as_table();

    settings.device_id = setting["device-id"].value_or(std::string{});
    settings.device_name = setting["device-name"].value_or(system::Hostname());
    settings.discovery_port = readInteger<std::uint16_t>(setting,
                                                         "discovery-port",
                                                         discovery::kDefaultDiscoveryPort);
    settings.transfer_port = readInteger<std::uint16_t>(setting,
                                                        "transfer-port",
                                                        transfer::kDefaultTransferPort);
    settings.auto_receive = setting["auto-receive"].value_or(true);
    settings.save_dir = setting["save-dir"].value_or(path::kDefaultSaveDir.string());
    settings.announce_interval_ms = readInteger<std::uint32_t>(
        setting,
        "announce-interval-ms",
        static_cast<std::uint32_t>(discovery::kAnnounceInterval.count()),
        static_cast<std::uint32_t>(discovery::kMinTimerInterval.count()));
    settings.staleness_window_ms = readInteger<std::uint32_t>(
        setting,
        "staleness-window-ms",
        static_cast<std::uint32_t>(discovery::kStalenessWindow.count()));
    settings.sweep_interval_ms = readInteger<std::uint32_t>(
        setting,
        "sweep-interval-ms",
        static_cast<std::uint32_t>(discovery::kSweepInterval.count()),
        static_cast<std::uint32_t>(discovery::kMinTimerInterval.count()));
    settings.confirm_timeout_s = readInteger<std::uint32_t>(
        setting,
        "confirm-timeout-s",
        static_cast<std::uint32_t>(transfer::kDefaultConfirmTimeout.count()));

    if (settings.staleness_window_ms < 2 * settings.announce_interval_ms) {
        spdlog::warn("staleness-window-ms ({}) is shorter than two announce intervals ({})",
                     settings.staleness_window_ms,
                     settings.announce_interval_ms);
    }
}

void InitConfig(const std::filesystem::path& config_dir) {
    if (!std::filesystem::exists(config_dir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(config_dir);
    }
    auto path = config_dir / kConfigFileName;
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();

    if (settings.device_id.empty()) {
        boost::uuids::random_generator uuid_gen;
        settings.device_id = boost::uuids::to_string(uuid_gen());
        spdlog::info("Generated device id {}", settings.device_id);
        SaveConfig(config_dir);
    }
}

void SaveConfig(const std::filesystem::path& config_dir) {
    auto path = config_dir / kConfigFileName;
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign(
        "setting",
        toml::table{
            {"device-id", settings.device_id},
            {"device-name", settings.device_name},
            {"discovery-port", static_cast<std::int64_t>(settings.discovery_port)},
            {"transfer-port", static_cast<std::int64_t>(settings.transfer_port)},
            {"auto-receive", settings.auto_receive},
            {"save-dir", settings.save_dir.string()},
            {"announce-interval-ms", static_cast<std::int64_t>(settings.announce_interval_ms)},
            {"staleness-window-ms", static_cast<std::int64_t>(settings.staleness_window_ms)},
            {"sweep-interval-ms", static_cast<std::int64_t>(settings.sweep_interval_ms)},
            {"confirm-timeout-s", static_cast<std::int64_t>(settings.confirm_timeout_s)},
        });
    ofs << config;
}

} // namespace landrop::core

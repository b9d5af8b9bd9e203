#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/async_logger.h>
#include <spdlog/logger.h>
#include <spdlog/common.h>
#include <spdlog/details/thread_pool.h>
#include <string_view>

namespace landrop::core {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::filesystem::path directory; // landrop_YYYY-MM-DD.log files, a new one each day
    bool console = true;
    std::size_t queue_size = 8192;
};

// Case-insensitive; accepts spdlog's names plus "warning"
std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name);

// Installs an async "landrop" logger as spdlog's default for as long as it lives, then hands
// the default back to whichever logger held it before.
// The file sink always records; the console sink can be switched off.
class LogSession {
public:
    explicit LogSession(const LogOptions& options);
    ~LogSession();

    LogSession(const LogSession&) = delete;
    LogSession& operator=(const LogSession&) = delete;

    void SetLevel(spdlog::level::level_enum level);
    spdlog::level::level_enum level() const;

    // Empty when the directory could not be created and only the console is active
    const std::filesystem::path& file_base() const { return file_base_; }
    void Flush();

private:
    std::shared_ptr<spdlog::details::thread_pool> pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
    std::shared_ptr<spdlog::logger> previous_;
    std::filesystem::path file_base_;
};

} // namespace landrop::core

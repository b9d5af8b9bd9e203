#include <algorithm>
#include <cctype>
#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace landrop::core {

namespace {

constexpr auto kConsolePattern = "\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v";
constexpr auto kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

void StampFile(std::FILE* file, const char* what) {
    if (!file) {
        return;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    std::fprintf(file, "==== landrop log %s %s ====\n", what, stamp);
}

spdlog::sink_ptr MakeFileSink(const fs::path& base) {
    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t&, std::FILE* file) { StampFile(file, "opened"); };
    handlers.before_close = [](const spdlog::filename_t&, std::FILE* file) { StampFile(file, "closed"); };
    // rotates at midnight, keeps every file
    auto sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(base.string(), 0, 0, false, 0, handlers);
    sink->set_pattern(kFilePattern);
    return sink;
}

} // namespace

std::optional<spdlog::level::level_enum> ParseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        return std::nullopt;
    }
    return level;
}

LogSession::LogSession(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    std::error_code ec;
    if (!options.directory.empty()) {
        fs::create_directories(options.directory, ec);
        if (ec) {
            std::fprintf(stderr,
                         "Cannot create log directory %s: %s\n",
                         options.directory.string().c_str(),
                         ec.message().c_str());
        } else {
            file_base_ = options.directory / "landrop.log";
            sinks.push_back(MakeFileSink(file_base_));
        }
    }

    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(console);
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    pool_ = std::make_shared<spdlog::details::thread_pool>(options.queue_size, 1);
    logger_ = std::make_shared<spdlog::async_logger>("landrop",
                                                     sinks.begin(),
                                                     sinks.end(),
                                                     pool_,
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(options.level);
    logger_->flush_on(spdlog::level::warn);
    logger_->set_error_handler([](const std::string& message) {
        std::fprintf(stderr, "landrop logger error: %s\n", message.c_str());
    });
    previous_ = spdlog::default_logger();
    spdlog::set_default_logger(logger_);
}

// Dropping the pool last lets its worker drain the queue into the sinks before joining
LogSession::~LogSession() {
    spdlog::set_default_logger(previous_);
    spdlog::drop(logger_->name());
}

void LogSession::SetLevel(spdlog::level::level_enum level) {
    logger_->set_level(level);
}

spdlog::level::level_enum LogSession::level() const {
    return logger_->level();
}

void LogSession::Flush() {
    logger_->flush();
}

} // namespace landrop::core

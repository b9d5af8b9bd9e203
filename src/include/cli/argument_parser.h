#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace landrop::cli {

struct CliOptions {
    std::optional<std::uint16_t> discovery_port;
    std::optional<std::uint16_t> transfer_port;
    std::optional<std::filesystem::path> save_dir;
    std::optional<std::filesystem::path> config_dir;
    std::optional<std::string> device_name;
    std::optional<std::string> log_level;
    bool no_auto_receive = false;
    bool show_help = false;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数, throws std::invalid_argument on a bad option or value
    CliOptions Parse();

    // 显示帮助信息
    static void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i_; // 当前解析的参数索引

    void parseOption(const std::string& arg, CliOptions& options);
    std::string nextValue(const std::string& arg);
    static std::uint16_t parsePort(const std::string& arg, const std::string& value);

    // 参数验证
    static void validateOptions(const CliOptions& options);
};

} // namespace landrop::cli

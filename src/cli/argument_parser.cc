#include <cli/argument_parser.h>
#include <core/util/logger.h>
#include <iostream>
#include <stdexcept>

namespace landrop::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i_(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;
    for (; i_ < argc_; ++i_) {
        parseOption(argv_[i_], options);
    }
    validateOptions(options);
    return options;
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "--discovery-port") {
        options.discovery_port = parsePort(arg, nextValue(arg));
    } else if (arg == "-p" || arg == "--transfer-port") {
        options.transfer_port = parsePort(arg, nextValue(arg));
    } else if (arg == "-s" || arg == "--save-dir") {
        options.save_dir = nextValue(arg);
    } else if (arg == "-c" || arg == "--config") {
        options.config_dir = nextValue(arg);
    } else if (arg == "-n" || arg == "--name") {
        options.device_name = nextValue(arg);
    } else if (arg == "--no-auto-receive") {
        options.no_auto_receive = true;
    } else if (arg == "-l" || arg == "--log-level") {
        options.log_level = nextValue(arg);
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw std::invalid_argument("Unknown option: " + arg);
    }
}

std::string ArgumentParser::nextValue(const std::string& arg) {
    if (++i_ >= argc_) {
        throw std::invalid_argument("Missing value for " + arg);
    }
    return argv_[i_];
}

std::uint16_t ArgumentParser::parsePort(const std::string& arg, const std::string& value) {
    int port = 0;
    try {
        std::size_t consumed = 0;
        port = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid port for " + arg + ": " + value);
    }
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("Port out of range for " + arg + ": " + value);
    }
    return static_cast<std::uint16_t>(port);
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level && !core::ParseLogLevel(*options.log_level)) {
        throw std::invalid_argument("Invalid log level: " + *options.log_level);
    }
    if (options.device_name && options.device_name->empty()) {
        throw std::invalid_argument("Device name must not be empty");
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: landrop [options]\n\n"
              << "Options:\n"
              << "      --discovery-port PORT  UDP discovery port (default: 5200)\n"
              << "  -p, --transfer-port PORT   TCP transfer port (default: 5201, 0 = any)\n"
              << "  -s, --save-dir DIR         Directory received files are saved to\n"
              << "  -c, --config DIR           Config directory\n"
              << "  -n, --name NAME            Display name announced to peers\n"
              << "      --no-auto-receive      Ask before accepting incoming transfers\n"
              << "  -l, --log-level LVL        Set log level (trace|debug|info|warning|error|off)\n"
              << "  -h, --help                 Show this help message\n\n"
              << "Type \"help\" at the prompt for the interactive commands.\n";
}

} // namespace landrop::cli

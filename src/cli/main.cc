#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <core/constant/path.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <iostream>
#include <service/backend_service.h>
#include <service/event_stream.h>
#include <spdlog/spdlog.h>

using namespace landrop;
using namespace landrop::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    cli::CliOptions options;
    try {
        options = cli::ArgumentParser(argc, argv).Parse();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        cli::ArgumentParser::ShowHelp();
        return 1;
    }
    if (options.show_help) {
        cli::ArgumentParser::ShowHelp();
        return 0;
    }

    LogOptions log_options;
#ifdef LANDROP_DEBUG
    log_options.level = spdlog::level::debug;
#endif
#ifdef LANDROP_RELEASE
    // the prompt owns the terminal in release builds, logs go to the file only
    log_options.console = false;
#endif
    log_options.directory = path::kLogDir;
    if (options.log_level) {
        log_options.level = ParseLogLevel(*options.log_level).value_or(log_options.level);
    }
    LogSession log_session(log_options);

    auto config_dir = options.config_dir.value_or(path::kConfigDir);
    InitConfig(config_dir);

    // Command line overrides apply to this run only, "dir" changes are persisted
    Settings runtime = settings;
    if (options.discovery_port) {
        runtime.discovery_port = *options.discovery_port;
    }
    if (options.transfer_port) {
        runtime.transfer_port = *options.transfer_port;
    }
    if (options.save_dir) {
        runtime.save_dir = *options.save_dir;
    }
    if (options.device_name) {
        runtime.device_name = *options.device_name;
    }
    if (options.no_auto_receive) {
        runtime.auto_receive = false;
    }
    const auto launch_save_dir = runtime.save_dir;

    net::io_context ioc;
    service::EventStream event_stream;
    service::BackendService backend_service(ioc, event_stream, runtime);

    try {
        backend_service.Start();
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start: {}", e.what());
        return 1;
    }
    spdlog::info("landrop started as {} ({}), transfer port {}",
                 runtime.device_name,
                 runtime.device_id,
                 backend_service.transfer_port());

    cli::CliManager cli_manager(ioc, backend_service, event_stream);
    auto quit = [&]() {
        backend_service.Stop();
        cli_manager.Stop();
        ioc.stop();
    };
    cli_manager.SetQuitCallback(quit);

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal_number);
            quit();
        }
    });

    cli_manager.Start();
    ioc.run();

    if (runtime.save_dir != launch_save_dir) {
        settings.save_dir = runtime.save_dir;
    }
    SaveConfig(config_dir);
    spdlog::info("landrop stopped");
    return 0;
}

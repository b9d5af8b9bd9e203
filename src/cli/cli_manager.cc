#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cctype>
#include <cli/cli_manager.h>
#include <filesystem>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sstream>

namespace fs = std::filesystem;
namespace net = boost::asio;

using namespace landrop::core;

namespace landrop::cli {

namespace {

constexpr auto kFeedbackPollInterval = std::chrono::milliseconds(100);

std::string ShortId(const std::string& id) {
    return id.substr(0, 8);
}

} // namespace

CliManager::CliManager(net::io_context& ioc,
                       service::BackendService& backend_service,
                       service::EventStream& event_stream)
    : ioc_(ioc)
    , backend_service_(backend_service)
    , event_stream_(event_stream)
    , poll_timer_(ioc) {}

CliManager::~CliManager() = default;

void CliManager::Start() {
    running_ = true;
    net::co_spawn(ioc_, pumpFeedback(), net::detached);

    try {
        terminal_ = std::make_unique<Terminal>(ioc_);
    } catch (const boost::system::system_error& e) {
        spdlog::warn("Interactive input unavailable ({}), running until interrupted", e.what());
        return;
    }
    printInfo(fmt::format("{} ({}) is ready, receiving into {}",
                          backend_service_.local_device().device_name,
                          ShortId(backend_service_.local_device().device_id),
                          backend_service_.save_dir().string()));
    printHelp();
    net::co_spawn(ioc_, readCommands(), net::detached);
}

void CliManager::Stop() {
    running_ = false;
    poll_timer_.cancel();
    if (terminal_) {
        terminal_->Close();
    }
}

void CliManager::ProcessCommand(const std::string& command) {
    executeCommand(parseCommand(command));
}

net::awaitable<void> CliManager::readCommands() {
    while (running_) {
        terminal_->PrintPrompt();
        auto line = co_await terminal_->ReadLine();
        if (!line) {
            // end of input behaves like "quit"
            if (running_) {
                handleQuit();
            }
            break;
        }
        ProcessCommand(*line);
    }
}

net::awaitable<void> CliManager::pumpFeedback() {
    while (running_) {
        while (auto feedback = event_stream_.PollFeedback()) {
            onFeedback(*feedback);
        }
        poll_timer_.expires_after(kFeedbackPollInterval);
        boost::system::error_code ec;
        co_await poll_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

void CliManager::handleListDevices() {
    last_listed_ = backend_service_.ListDevices();
    printDeviceList(last_listed_);
}

void CliManager::handleSendFiles(const std::string& target, const std::vector<std::string>& paths) {
    auto device = resolveDevice(target);
    if (!device) {
        printError("device not found: " + target);
        return;
    }

    std::vector<fs::path> file_paths(paths.begin(), paths.end());
    std::vector<FileEntry> entries;
    try {
        entries = backend_service_.CollectEntries(file_paths);
    } catch (const TransferError& e) {
        printError(fmt::format("cannot collect files: {}", e.what()));
        return;
    }
    if (entries.empty()) {
        printError("No valid files to send.");
        return;
    }

    auto task_id = backend_service_.SendFiles(device->device_id, std::move(entries));
    if (task_id.empty()) {
        printError("send file fail");
        return;
    }
    printInfo(fmt::format("Sending to {} as transfer {}", device->device_name, task_id));
}

void CliManager::handleRespond(const std::vector<std::string>& args, bool accepted) {
    if (args.size() < 2) {
        printError(fmt::format("usage: {} <transfer id>{}", args[0], accepted ? "" : " [reason]"));
        return;
    }
    std::string reason;
    for (std::size_t i = 2; i < args.size(); ++i) {
        reason += (i > 2 ? " " : "") + args[i];
    }
    if (!backend_service_.RespondToRequest(args[1], accepted, reason)) {
        printError("no pending request " + args[1]);
    }
}

void CliManager::handleCancel(const std::string& task_id) {
    if (!backend_service_.CancelTransfer(task_id)) {
        printError("no cancellable transfer " + task_id);
    }
}

void CliManager::handleSaveDir(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printInfo("save directory: " + backend_service_.save_dir().string());
        return;
    }
    if (backend_service_.SetSaveDir(args[1])) {
        printInfo("save directory: " + backend_service_.save_dir().string());
    } else {
        printError("not a directory: " + args[1]);
    }
}

void CliManager::handleQuit() {
    Stop();
    if (quit_callback_) {
        quit_callback_();
    }
}

std::vector<std::string> CliManager::parseCommand(const std::string& command) {
    std::vector<std::string> args;
    std::istringstream iss(command);
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }
    return args;
}

void CliManager::executeCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        return;
    }
    const std::string& cmd = args[0];
    if (cmd == "list") {
        handleListDevices();
    } else if (cmd == "refresh") {
        backend_service_.RefreshDevices();
        printInfo("announced");
    } else if (cmd == "send") {
        if (args.size() >= 3) {
            handleSendFiles(args[1], std::vector<std::string>(args.begin() + 2, args.end()));
        } else {
            printError("args too less, correct format: send <device> <path>...");
        }
    } else if (cmd == "accept") {
        handleRespond(args, true);
    } else if (cmd == "reject") {
        handleRespond(args, false);
    } else if (cmd == "cancel") {
        if (args.size() >= 2) {
            handleCancel(args[1]);
        } else {
            printError("usage: cancel <transfer id>");
        }
    } else if (cmd == "dir") {
        handleSaveDir(args);
    } else if (cmd == "help") {
        printHelp();
    } else if (cmd == "clear") {
        if (terminal_) {
            terminal_->ClearScreen();
        }
    } else if (cmd == "quit" || cmd == "exit") {
        handleQuit();
    } else {
        printError("unknown command: " + cmd);
    }
}

std::optional<DeviceInfo> CliManager::resolveDevice(const std::string& target) const {
    // index from the last "list", then id, then display name
    if (!target.empty() && target.size() < 6
        && std::all_of(target.begin(), target.end(), ::isdigit)) {
        auto index = std::stoul(target);
        if (index >= 1 && index <= last_listed_.size()) {
            return last_listed_[index - 1];
        }
    }
    auto devices = backend_service_.ListDevices();
    for (const auto& device : devices) {
        if (device.device_id == target || device.device_name == target) {
            return device;
        }
    }
    return std::nullopt;
}

void CliManager::onFeedback(const Feedback& feedback) {
    try {
        switch (feedback.type) {
        case FeedbackType::kSettings:
            spdlog::debug("Settings: {}", feedback.data.dump());
            break;
        case FeedbackType::kFoundDevice: {
            auto found = feedback.data.get<feedback::FoundDevice>();
            printInfo(fmt::format("found {} ({}) at {}",
                                  found.device_info.device_name,
                                  found.device_info.platform,
                                  found.device_info.ip_address));
            break;
        }
        case FeedbackType::kLostDevice: {
            auto lost = feedback.data.get<feedback::LostDevice>();
            printInfo(fmt::format("{} went offline", lost.device_info.device_name));
            break;
        }
        case FeedbackType::kDiscoveryFailed: {
            auto failed = feedback.data.get<feedback::DiscoveryFailed>();
            printError("discovery stopped: " + failed.error_message);
            break;
        }
        case FeedbackType::kTransferRequested: {
            auto requested = feedback.data.get<feedback::TransferRequested>();
            const auto& task = requested.task;
            printInfo(fmt::format("{} wants to send {} entries ({} bytes), transfer {}",
                                  task.device_name,
                                  task.files.size(),
                                  task.total_size,
                                  task.task_id));
            if (!requested.auto_accepted) {
                printInfo(fmt::format("  accept {0} | reject {0} [reason]", task.task_id));
            }
            break;
        }
        case FeedbackType::kTransferAccepted: {
            auto accepted = feedback.data.get<feedback::TransferAccepted>();
            printInfo(fmt::format("transfer {} accepted", ShortId(accepted.task_id)));
            break;
        }
        case FeedbackType::kTransferRejected: {
            auto rejected = feedback.data.get<feedback::TransferRejected>();
            printInfo(fmt::format("transfer {} rejected: {}",
                                  ShortId(rejected.task_id),
                                  rejected.reason));
            break;
        }
        case FeedbackType::kTransferProgress:
            progress_display_.UpdateProgress(feedback.data.get<feedback::TransferProgress>());
            break;
        case FeedbackType::kTransferCompleted: {
            auto completed = feedback.data.get<feedback::TransferCompleted>();
            printInfo(fmt::format("transfer {} completed, {} bytes",
                                  ShortId(completed.task.task_id),
                                  completed.task.transferred_size));
            break;
        }
        case FeedbackType::kTransferError: {
            auto error = feedback.data.get<feedback::TransferError>();
            if (error.status == TransferStatus::kCancelled) {
                printInfo(fmt::format("transfer {} cancelled", ShortId(error.task_id)));
            } else {
                printError(fmt::format("transfer {} failed ({}): {}",
                                       ShortId(error.task_id),
                                       ErrorKindToString(error.kind),
                                       error.error_message));
            }
            break;
        }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed feedback {}: {}", nlohmann::json(feedback.type).dump(), e.what());
    }
}

void CliManager::printDeviceList(const std::vector<DeviceInfo>& devices) {
    if (devices.empty()) {
        printInfo("no devices online");
        return;
    }
    printInfo("device list:");
    for (std::size_t i = 0; i < devices.size(); ++i) {
        const auto& device = devices[i];
        printInfo(fmt::format("  {}. {} [{}] {}:{} id={}",
                              i + 1,
                              device.device_name,
                              nlohmann::json(device.device_type).get<std::string>(),
                              device.ip_address,
                              device.port,
                              device.device_id));
    }
}

void CliManager::printHelp() {
    printInfo("Available commands are as follows:");
    printInfo("  list - List online devices");
    printInfo("  refresh - Announce this device right away");
    printInfo("  send <device> <path>... - Send files or folders (device: number, id or name)");
    printInfo("  accept <transfer id> - Accept an incoming transfer");
    printInfo("  reject <transfer id> [reason] - Reject an incoming transfer");
    printInfo("  cancel <transfer id> - Cancel a transfer");
    printInfo("  dir [path] - Show or change the save directory");
    printInfo("  help - Show this help information");
    printInfo("  quit - Exit the program");
}

void CliManager::printInfo(const std::string& message) {
    progress_display_.ClearProgress();
    if (terminal_) {
        terminal_->PrintInfo(message);
    } else {
        spdlog::info("{}", message);
    }
}

void CliManager::printError(const std::string& message) {
    progress_display_.ClearProgress();
    if (terminal_) {
        terminal_->PrintError(message);
    } else {
        spdlog::error("{}", message);
    }
}

} // namespace landrop::cli

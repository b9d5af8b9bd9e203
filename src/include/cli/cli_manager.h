#pragma once

#include "progress_display.h"
#include "terminal.h"
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/model.h>
#include <functional>
#include <memory>
#include <optional>
#include <service/backend_service.h>
#include <service/event_stream.h>
#include <string>
#include <vector>

namespace landrop::cli {

class CliManager {
public:
    CliManager(boost::asio::io_context& ioc,
               service::BackendService& backend_service,
               service::EventStream& event_stream);
    ~CliManager();

    CliManager(const CliManager&) = delete;
    CliManager& operator=(const CliManager&) = delete;

    // Starts the feedback pump, and the prompt when stdin can be read asynchronously
    void Start();
    void Stop();

    // 命令处理
    void ProcessCommand(const std::string& command);

    void SetQuitCallback(std::function<void()> callback) { quit_callback_ = std::move(callback); }

private:
    boost::asio::awaitable<void> readCommands();
    boost::asio::awaitable<void> pumpFeedback();

    // 命令实现
    void handleListDevices();
    void handleSendFiles(const std::string& target, const std::vector<std::string>& paths);
    void handleRespond(const std::vector<std::string>& args, bool accepted);
    void handleCancel(const std::string& task_id);
    void handleSaveDir(const std::vector<std::string>& args);
    void handleQuit();

    // 命令解析
    std::vector<std::string> parseCommand(const std::string& command);
    void executeCommand(const std::vector<std::string>& args);
    std::optional<core::DeviceInfo> resolveDevice(const std::string& target) const;

    // 事件处理
    void onFeedback(const core::Feedback& feedback);

    void printDeviceList(const std::vector<core::DeviceInfo>& devices);
    void printHelp();
    void printInfo(const std::string& message);
    void printError(const std::string& message);

    boost::asio::io_context& ioc_;
    service::BackendService& backend_service_;
    service::EventStream& event_stream_;
    std::unique_ptr<Terminal> terminal_;
    ProgressDisplay progress_display_;
    boost::asio::steady_timer poll_timer_;
    std::vector<core::DeviceInfo> last_listed_;
    std::function<void()> quit_callback_;
    bool running_{false};
};

} // namespace landrop::cli

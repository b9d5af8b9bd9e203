#pragma once

#include "event_stream.h"
#include <boost/asio/io_context.hpp>
#include <core/model/device_info.h>
#include <core/model/file_entry.h>
#include <core/network/client/transfer_client.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/server/transfer_server.h>
#include <core/transfer/transfer_gate.h>
#include <core/util/config.h>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief 后端服务类
 *
 * @details 集成了 landrop 的所有基本功能: device registry, discovery, transfer server and
 * transfer client on one io_context. Every notification is posted to the EventStream, the
 * front end polls it. Operations are plain member calls made on the io_context thread.
 *
 * @note 此类不可复制或赋值。
 */
namespace landrop::service {

class BackendService {
public:
    // settings must outlive the service; SetSaveDir/SetAutoReceive write through to it
    BackendService(boost::asio::io_context& ioc, EventStream& event_stream, core::Settings& settings);
    ~BackendService();
    BackendService(const BackendService&) = delete;
    BackendService& operator=(const BackendService&) = delete;

    // Throws boost::system::system_error if the transfer port cannot be bound. A discovery bind
    // failure is reported as DiscoveryFailed and the service keeps running without discovery.
    void Start();
    void Stop();

    std::vector<core::DeviceInfo> ListDevices() const { return registry_.List(); }
    void RefreshDevices();

    std::vector<core::FileEntry> CollectEntries(const std::vector<std::filesystem::path>& paths) const;

    // Empty when the device is unknown or offline or there is nothing to send
    std::string SendFiles(std::string_view device_id, std::vector<core::FileEntry> entries);

    bool RespondToRequest(std::string_view task_id, bool accepted, std::string reason = {});
    bool CancelTransfer(std::string_view task_id);

    const std::filesystem::path& save_dir() const { return settings_.save_dir; }
    // Only existing directories are accepted
    bool SetSaveDir(const std::filesystem::path& save_dir);
    void SetAutoReceive(bool auto_receive);

    const core::DeviceInfo& local_device() const { return discovery_manager_.local_device(); }
    std::uint16_t transfer_port() const { return transfer_server_.port(); }
    std::uint16_t discovery_port() const { return discovery_manager_.port(); }
    bool running() const { return is_running_; }

private:
    core::DeviceInfo localDevice() const;
    void postSettings();

    // 反馈给前端
    void feedback(core::Feedback&& feedback) { event_stream_.PostFeedback(std::move(feedback)); }

    boost::asio::io_context& ioc_;
    EventStream& event_stream_;
    core::Settings& settings_;
    core::TransferGate gate_;
    core::DeviceRegistry registry_;
    core::DiscoveryManager discovery_manager_;
    core::TransferServer transfer_server_;
    core::TransferClient transfer_client_;
    bool is_running_{false};
};

} // namespace landrop::service

#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/device_info.h>
#include <core/network/discovery/device_registry.h>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace landrop::core {

struct DiscoveryOptions {
    std::uint16_t port = discovery::kDefaultDiscoveryPort; // 0 binds an ephemeral port
    std::string broadcast_address = discovery::kBroadcastAddress;
    std::uint16_t announce_port = 0; // 0 announces on the bound port
    std::chrono::steady_clock::duration announce_interval = discovery::kAnnounceInterval;
    std::chrono::steady_clock::duration sweep_interval = discovery::kSweepInterval;
};

// 设备发现: announces the local device on the broadcast channel and feeds peer announcements
// into the registry. Malformed datagrams and our own announcements are dropped silently.
class DiscoveryManager {
public:
    using DeviceCallback = std::function<void(const DeviceInfo&)>;
    using FailureCallback = std::function<void(const std::string&)>;

    // local carries the identity that is announced: id, name, platform and transfer port
    DiscoveryManager(boost::asio::io_context& ioc,
                     DeviceRegistry& registry,
                     DeviceInfo local,
                     DiscoveryOptions options = {});
    ~DiscoveryManager();

    DiscoveryManager(const DiscoveryManager&) = delete;
    DiscoveryManager& operator=(const DiscoveryManager&) = delete;

    // Throws boost::system::system_error if the endpoint cannot be bound
    void Start();
    void Stop();

    // Sends one announcement right away, used for "refresh"
    void Announce();

    bool running() const { return running_; }
    std::uint16_t port() const;
    const DeviceInfo& local_device() const { return local_; }

    // Announced transfer port, for a server that bound an ephemeral port
    void SetTransferPort(std::uint16_t port) { local_.port = port; }

    // 事件接口
    void SetDeviceFoundCallback(DeviceCallback callback) { device_found_callback_ = std::move(callback); }
    void SetDeviceLostCallback(DeviceCallback callback) { device_lost_callback_ = std::move(callback); }
    // Socket-level failure; discovery is stopped and stays stopped
    void SetFailureCallback(FailureCallback callback) { failure_callback_ = std::move(callback); }

private:
    boost::asio::io_context& io_context_;
    DeviceRegistry& registry_;
    DeviceInfo local_;
    DiscoveryOptions options_;
    bool running_{false};

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint broadcast_endpoint_;
    boost::asio::steady_timer broadcast_timer_;
    boost::asio::steady_timer sweep_timer_;

    DeviceCallback device_found_callback_;
    DeviceCallback device_lost_callback_;
    FailureCallback failure_callback_;

    // 协程任务
    boost::asio::awaitable<void> broadcaster();
    boost::asio::awaitable<void> listener();
    boost::asio::awaitable<void> sweeper();
    boost::asio::awaitable<void> sendAnnouncement();

    void handleDatagram(std::string_view data, const std::string& source_address);
    void fail(const std::string& message);
    std::string buildAnnouncement() const;
};

} // namespace landrop::core

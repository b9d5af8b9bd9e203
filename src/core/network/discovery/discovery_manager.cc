#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <array>
#include <core/model/dto/announce_dto.h>
#include <core/network/discovery/discovery_manager.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;
using json = nlohmann::json;

namespace landrop::core {

DiscoveryManager::DiscoveryManager(io_context& ioc,
                                   DeviceRegistry& registry,
                                   DeviceInfo local,
                                   DiscoveryOptions options)
    : io_context_(ioc)
    , registry_(registry)
    , local_(std::move(local))
    , options_(std::move(options))
    , socket_(ioc)
    , broadcast_timer_(ioc)
    , sweep_timer_(ioc)
    , device_found_callback_(
          [](const DeviceInfo& device) { spdlog::info("Device found: {}", device.device_id); })
    , device_lost_callback_(
          [](const DeviceInfo& device) { spdlog::info("Device lost: {}", device.device_id); }) {}

DiscoveryManager::~DiscoveryManager() {
    Stop();
}

void DiscoveryManager::Start() {
    if (running_) {
        spdlog::warn("Discovery is already running.");
        return;
    }

    ip::udp::endpoint listen_endpoint(ip::udp::v4(), options_.port);
    try {
        socket_.open(listen_endpoint.protocol());
        socket_.set_option(socket_base::reuse_address(true));
        socket_.set_option(socket_base::broadcast(true));
        socket_.bind(listen_endpoint);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to bind discovery endpoint on port {}: {}", options_.port, e.what());
        boost::system::error_code ignored;
        socket_.close(ignored);
        throw;
    }

    auto announce_port = options_.announce_port != 0 ? options_.announce_port : port();
    broadcast_endpoint_ = ip::udp::endpoint(ip::make_address(options_.broadcast_address),
                                            announce_port);
    running_ = true;
    spdlog::info("Discovery started on UDP port {}, announcing to {}:{}",
                 port(),
                 options_.broadcast_address,
                 announce_port);

    co_spawn(io_context_, broadcaster(), detached);
    co_spawn(io_context_, listener(), detached);
    co_spawn(io_context_, sweeper(), detached);
}

void DiscoveryManager::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        spdlog::warn("Error closing discovery socket: {}", ec.message());
    }
    broadcast_timer_.cancel();
    sweep_timer_.cancel();
    spdlog::info("Discovery stopped.");
}

void DiscoveryManager::Announce() {
    if (!running_) {
        spdlog::warn("Discovery is not running, announcement skipped.");
        return;
    }
    co_spawn(io_context_, sendAnnouncement(), detached);
}

std::uint16_t DiscoveryManager::port() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

std::string DiscoveryManager::buildAnnouncement() const {
    AnnounceDto dto;
    dto.device_id = local_.device_id;
    dto.device_name = local_.device_name;
    dto.platform = local_.platform;
    dto.transfer_port = local_.port;
    dto.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    return json(dto).dump();
}

awaitable<void> DiscoveryManager::sendAnnouncement() {
    auto data = buildAnnouncement();
    boost::system::error_code ec;
    co_await socket_.async_send_to(buffer(data),
                                   broadcast_endpoint_,
                                   redirect_error(use_awaitable, ec));
    if (ec && ec != error::operation_aborted) {
        // the next interval retries
        spdlog::warn("Failed to send announcement: {}", ec.message());
    }
}

awaitable<void> DiscoveryManager::broadcaster() {
    while (running_) {
        co_await sendAnnouncement();
        if (!running_) {
            break;
        }

        broadcast_timer_.expires_after(options_.announce_interval);
        boost::system::error_code ec;
        co_await broadcast_timer_.async_wait(redirect_error(use_awaitable, ec));
    }
    spdlog::debug("Broadcaster finished.");
}

awaitable<void> DiscoveryManager::listener() {
    std::array<char, discovery::kMaxDatagramSize> recv_buffer;
    ip::udp::endpoint sender_endpoint;

    while (running_) {
        boost::system::error_code ec;
        auto bytes_received = co_await socket_.async_receive_from(buffer(recv_buffer),
                                                                  sender_endpoint,
                                                                  redirect_error(use_awaitable,
                                                                                 ec));
        if (ec) {
            if (ec != error::operation_aborted && running_) {
                fail(ec.message());
            }
            break;
        }
        handleDatagram(std::string_view(recv_buffer.data(), bytes_received),
                       sender_endpoint.address().to_string());
    }
    spdlog::debug("Listener finished.");
}

awaitable<void> DiscoveryManager::sweeper() {
    while (running_) {
        sweep_timer_.expires_after(options_.sweep_interval);
        boost::system::error_code ec;
        co_await sweep_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (!running_) {
            break;
        }
        for (const auto& device : registry_.Sweep()) {
            spdlog::info("Device {} ({}) is offline", device.device_name, device.device_id);
            if (device_lost_callback_) {
                device_lost_callback_(device);
            }
        }
    }
    spdlog::debug("Sweeper finished.");
}

void DiscoveryManager::handleDatagram(std::string_view data, const std::string& source_address) {
    AnnounceDto announce;
    try {
        json::parse(data).get_to(announce);
    } catch (const std::exception& e) {
        spdlog::debug("Dropped datagram from {}: {}", source_address, e.what());
        return;
    }

    // 判断是否是自己的设备
    if (announce.device_id == local_.device_id) {
        return;
    }

    if (registry_.Upsert(announce, source_address)) {
        auto device = registry_.Get(announce.device_id);
        spdlog::info("Discovered {} ({}) at {}:{}",
                     announce.device_name,
                     announce.device_id,
                     source_address,
                     announce.transfer_port);
        if (device && device_found_callback_) {
            device_found_callback_(*device);
        }
    }
}

void DiscoveryManager::fail(const std::string& message) {
    spdlog::error("Discovery socket failure: {}", message);
    Stop();
    if (failure_callback_) {
        failure_callback_(message);
    }
}

} // namespace landrop::core

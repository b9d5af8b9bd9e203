#include "test_util.h"
#include <array>
#include <boost/asio/ip/udp.hpp>
#include <core/model/dto/announce_dto.h>
#include <core/network/discovery/discovery_manager.h>
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>

using namespace landrop::core;
using landrop::test::RunUntil;
using namespace std::chrono_literals;
namespace net = boost::asio;
using udp = net::ip::udp;
using json = nlohmann::json;

namespace {

DeviceInfo LocalIdentity() {
    DeviceInfo local;
    local.device_id = "local-device";
    local.device_name = "local";
    local.platform = "linux";
    local.port = 5201;
    return local;
}

std::string Announcement(const std::string& id, std::uint16_t port = 6000) {
    return json(AnnounceDto{.device_id = id,
                            .device_name = "peer " + id,
                            .platform = "android",
                            .transfer_port = port,
                            .timestamp = 1})
        .dump();
}

// Descriptor of the IPv4 UDP socket bound to port, -1 if none is open
int FindUdpSocket(std::uint16_t port) {
    for (int fd = 3; fd < 1024; ++fd) {
        int type = 0;
        socklen_t type_length = sizeof(type);
        if (::getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &type_length) != 0 || type != SOCK_DGRAM) {
            continue;
        }
        sockaddr_in address{};
        socklen_t length = sizeof(address);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length) == 0
            && address.sin_family == AF_INET && ntohs(address.sin_port) == port) {
            return fd;
        }
    }
    return -1;
}

class DiscoveryManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        peer_socket_.open(udp::v4());
        peer_socket_.bind(udp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    }

    void StartDiscovery(std::chrono::milliseconds staleness = 10000ms,
                        std::chrono::milliseconds sweep = 1000ms,
                        std::chrono::milliseconds announce = 3000ms) {
        registry_ = std::make_unique<DeviceRegistry>(staleness);
        DiscoveryOptions options;
        options.port = 0;
        options.broadcast_address = "127.0.0.1";
        options.announce_port = peer_socket_.local_endpoint().port();
        options.sweep_interval = sweep;
        options.announce_interval = announce;
        manager_ = std::make_unique<DiscoveryManager>(ioc_, *registry_, LocalIdentity(), options);
        manager_->SetDeviceFoundCallback([this](const DeviceInfo& device) { found_.push_back(device); });
        manager_->SetDeviceLostCallback([this](const DeviceInfo& device) { lost_.push_back(device); });
        manager_->SetFailureCallback([this](const std::string& message) { failures_.push_back(message); });
        manager_->Start();
        ASSERT_NE(manager_->port(), 0);
    }

    void SendToManager(const std::string& payload) {
        peer_socket_.send_to(net::buffer(payload),
                             udp::endpoint(net::ip::make_address("127.0.0.1"), manager_->port()));
    }

    net::io_context ioc_;
    udp::socket peer_socket_{ioc_};
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<DiscoveryManager> manager_;
    std::vector<DeviceInfo> found_;
    std::vector<DeviceInfo> lost_;
    std::vector<std::string> failures_;
};

} // namespace

TEST_F(DiscoveryManagerTest, AnnouncesLocalIdentityOnStart) {
    StartDiscovery();

    std::array<char, 2048> buffer;
    udp::endpoint sender;
    std::size_t received = 0;
    peer_socket_.async_receive_from(net::buffer(buffer),
                                    sender,
                                    [&](const boost::system::error_code& ec, std::size_t n) {
                                        if (!ec) {
                                            received = n;
                                        }
                                    });
    ASSERT_TRUE(RunUntil(ioc_, [&] { return received > 0; }));

    auto announce = json::parse(std::string(buffer.data(), received));
    EXPECT_EQ(announce["kind"], "announce");
    EXPECT_EQ(announce["deviceId"], "local-device");
    EXPECT_EQ(announce["deviceName"], "local");
    EXPECT_EQ(announce["platform"], "linux");
    EXPECT_EQ(announce["transferPort"], 5201);
    EXPECT_TRUE(announce["timestamp"].is_number_integer());
}

TEST_F(DiscoveryManagerTest, PeerAnnouncementRegistersDevice) {
    StartDiscovery();
    SendToManager(Announcement("peer-1", 6000));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !found_.empty(); }));
    EXPECT_EQ(found_[0].device_id, "peer-1");
    EXPECT_EQ(found_[0].ip_address, "127.0.0.1");
    EXPECT_EQ(found_[0].port, 6000);
    EXPECT_EQ(found_[0].device_type, DeviceType::kMobile);
    EXPECT_EQ(registry_->List().size(), 1u);
}

TEST_F(DiscoveryManagerTest, RepeatedAnnouncementsReportOnce) {
    StartDiscovery();
    SendToManager(Announcement("peer-1"));
    SendToManager(Announcement("peer-1"));
    SendToManager(Announcement("peer-2"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return found_.size() >= 2; }));
    RunUntil(ioc_, [] { return false; }, 200ms);
    EXPECT_EQ(found_.size(), 2u);
    EXPECT_EQ(registry_->size(), 2u);
}

TEST_F(DiscoveryManagerTest, OwnAnnouncementsAreIgnored) {
    StartDiscovery();
    SendToManager(Announcement("local-device"));
    SendToManager(Announcement("peer-1"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !found_.empty(); }));
    EXPECT_EQ(found_.size(), 1u);
    EXPECT_FALSE(registry_->Get("local-device").has_value());
}

TEST_F(DiscoveryManagerTest, MalformedDatagramsAreDropped) {
    StartDiscovery();
    SendToManager("garbage");
    SendToManager("[1,2]");
    SendToManager(R"({"kind":"hello","deviceId":"x"})");
    SendToManager(R"({"kind":"announce","deviceId":"","deviceName":"n","platform":"linux","transferPort":1,"timestamp":1})");
    SendToManager(R"({"kind":"announce","deviceId":"wrap","deviceName":"n","platform":"linux","transferPort":70000,"timestamp":1})");
    SendToManager(R"({"kind":"announce","deviceId":"zero","deviceName":"n","platform":"linux","transferPort":0,"timestamp":1})");
    SendToManager(Announcement("peer-1"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !found_.empty(); }));
    EXPECT_EQ(found_.size(), 1u);
    EXPECT_EQ(found_[0].device_id, "peer-1");
    EXPECT_FALSE(registry_->Get("wrap").has_value());
    EXPECT_FALSE(registry_->Get("zero").has_value());
    EXPECT_TRUE(manager_->running());
}

TEST_F(DiscoveryManagerTest, AddressInPayloadIsNotTrusted) {
    StartDiscovery();
    auto payload = json::parse(Announcement("peer-1"));
    payload["ip"] = "10.9.9.9";
    payload["ipAddress"] = "10.9.9.9";
    SendToManager(payload.dump());

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !found_.empty(); }));
    EXPECT_EQ(found_[0].ip_address, "127.0.0.1");
}

TEST_F(DiscoveryManagerTest, SilentPeerGoesOffline) {
    StartDiscovery(300ms, 50ms);
    SendToManager(Announcement("peer-1"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !found_.empty(); }));
    ASSERT_TRUE(RunUntil(ioc_, [&] { return !lost_.empty(); }, 3s));
    EXPECT_EQ(lost_[0].device_id, "peer-1");
    EXPECT_TRUE(registry_->List().empty());

    RunUntil(ioc_, [] { return false; }, 300ms);
    EXPECT_EQ(lost_.size(), 1u);
}

TEST_F(DiscoveryManagerTest, StopReleasesEndpoint) {
    StartDiscovery();
    manager_->Stop();
    EXPECT_FALSE(manager_->running());
    EXPECT_EQ(manager_->port(), 0);
    RunUntil(ioc_, [] { return false; }, 50ms);
}

TEST(DiscoveryManagerBindTest, BindFailureThrows) {
    net::io_context ioc;
    udp::socket blocker(ioc);
    blocker.open(udp::v4());
    blocker.bind(udp::endpoint(udp::v4(), 0));
    auto taken = blocker.local_endpoint().port();

    DeviceRegistry registry(10000ms);
    DiscoveryOptions options;
    options.port = taken;
    DiscoveryManager manager(ioc, registry, LocalIdentity(), options);
    // the blocker did not set SO_REUSEADDR, so the port stays taken
    EXPECT_THROW(manager.Start(), boost::system::system_error);
    EXPECT_FALSE(manager.running());
}

TEST_F(DiscoveryManagerTest, SocketErrorStopsDiscovery) {
    StartDiscovery(10000ms, 1000ms, 3600000ms);
    // let the first announcement go out and the listener park on the socket
    RunUntil(ioc_, [] { return false; }, 100ms);
    int fd = FindUdpSocket(manager_->port());
    ASSERT_GE(fd, 0);

    // a port nobody listens on; the ICMP reply leaves a pending error on the discovery socket
    udp::socket unused(ioc_, udp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto closed_port = unused.local_endpoint().port();
    unused.close();

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(closed_port);
    ::inet_pton(AF_INET, "127.0.0.1", &target.sin_addr);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&target), sizeof(target)), 0);
    ASSERT_EQ(::send(fd, "x", 1, 0), 1);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return !failures_.empty(); }, 3s));
    EXPECT_FALSE(manager_->running());
    EXPECT_EQ(manager_->port(), 0);

    // no automatic restart
    RunUntil(ioc_, [] { return false; }, 200ms);
    EXPECT_EQ(failures_.size(), 1u);
    EXPECT_FALSE(manager_->running());
}

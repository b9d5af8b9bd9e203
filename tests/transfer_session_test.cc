#include "test_util.h"
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/network/client/transfer_client.h>
#include <core/network/server/transfer_server.h>
#include <core/transfer/file_collector.h>
#include <core/util/wire_format.h>
#include <gtest/gtest.h>

using namespace landrop::core;
using namespace landrop::test;
using namespace std::chrono_literals;
namespace fs = std::filesystem;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

// What a hand-driven peer saw on its side of the connection
struct RawExchange {
    std::string response;
    std::string ack;
    boost::system::error_code error;
    bool done = false;
};

// Plays the initiator byte by byte: request line, data frames, optional sentinel, acknowledgment
net::awaitable<void> RawSender(std::uint16_t port,
                               std::string request_line,
                               std::vector<std::string> frames,
                               bool send_sentinel,
                               RawExchange* out) {
    tcp::socket socket(co_await net::this_coro::executor);
    boost::system::error_code ec;
    std::string inbound;

    co_await socket.async_connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port),
                                  net::redirect_error(net::use_awaitable, ec));
    if (!ec) {
        co_await net::async_write(socket,
                                  net::buffer(request_line),
                                  net::redirect_error(net::use_awaitable, ec));
    }
    if (!ec) {
        auto n = co_await net::async_read_until(socket,
                                                net::dynamic_buffer(inbound),
                                                '\n',
                                                net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            out->response = inbound.substr(0, n);
            inbound.erase(0, n);
        }
    }
    for (const auto& frame : frames) {
        if (ec) {
            break;
        }
        auto header = EncodeFrameHeader(static_cast<std::uint32_t>(frame.size()));
        std::array<net::const_buffer, 2> buffers{net::buffer(header), net::buffer(frame)};
        co_await net::async_write(socket, buffers, net::redirect_error(net::use_awaitable, ec));
    }
    if (!ec && send_sentinel) {
        auto sentinel = EncodeFrameHeader(kEndOfTransfer);
        co_await net::async_write(socket,
                                  net::buffer(sentinel),
                                  net::redirect_error(net::use_awaitable, ec));
    }
    if (!ec) {
        auto n = co_await net::async_read_until(socket,
                                                net::dynamic_buffer(inbound),
                                                '\n',
                                                net::redirect_error(net::use_awaitable, ec));
        if (!ec) {
            out->ack = inbound.substr(0, n);
        }
    }
    out->error = ec;
    out->done = true;
}

// Plays a responder that accepts and then never reads another byte until released
net::awaitable<void> StallingReceiver(tcp::acceptor* acceptor, net::steady_timer* release) {
    boost::system::error_code ec;
    auto socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return;
    }
    std::string inbound;
    co_await net::async_read_until(socket,
                                   net::dynamic_buffer(inbound),
                                   '\n',
                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return;
    }
    auto response = EncodeRecord(json{{"kind", "transfer_response"}, {"accepted", true}});
    co_await net::async_write(socket,
                              net::buffer(response),
                              net::redirect_error(net::use_awaitable, ec));
    co_await release->async_wait(net::redirect_error(net::use_awaitable, ec));
}

std::string RequestLine(const std::string& task_id, const json& files, std::uint64_t total_size) {
    return EncodeRecord(json{
        {"kind", "transfer_request"},
        {"taskId", task_id},
        {"sender", {{"deviceId", "raw-peer"}, {"deviceName", "raw peer"}}},
        {"totalSize", total_size},
        {"files", files},
    });
}

json SingleFile(const std::string& name, std::uint64_t size) {
    return json::array({{{"name", name}, {"size", size}, {"isDirectory", false}}});
}

class TransferSessionTest : public ::testing::Test {
protected:
    void StartServer(bool auto_accept = true) {
        ReceiveOptions options;
        options.save_dir = inbox();
        options.auto_accept = auto_accept;
        server_ = std::make_unique<TransferServer>(ioc_, receiver_gate_, options, receiver_log_.callback());
        server_->Start(0);
        ASSERT_NE(server_->port(), 0);
    }

    TransferClient& client() {
        if (!client_) {
            DeviceInfo local;
            local.device_id = "sender-device";
            local.device_name = "sender";
            local.platform = "linux";
            client_ = std::make_unique<TransferClient>(ioc_, sender_gate_, local, sender_log_.callback());
        }
        return *client_;
    }

    DeviceInfo Receiver(std::uint16_t port) const {
        DeviceInfo peer;
        peer.device_id = "receiver-device";
        peer.device_name = "receiver";
        peer.platform = "linux";
        peer.ip_address = "127.0.0.1";
        peer.port = port;
        return peer;
    }

    fs::path inbox() const { return dir_ / "inbox"; }
    fs::path outbox() const { return dir_ / "outbox"; }

    std::vector<FileEntry> OneFile(std::size_t size) {
        WriteFile(outbox() / "payload.bin", MakeContent(size));
        return CollectEntries({outbox() / "payload.bin"});
    }

    static bool Terminal(const FeedbackLog& log) {
        return log.has(FeedbackType::kTransferCompleted) || log.has(FeedbackType::kTransferRejected)
               || log.has(FeedbackType::kTransferError);
    }

    static std::size_t FullProgressReports(const FeedbackLog& log) {
        std::size_t n = 0;
        for (const auto& event : log.events) {
            if (event.type == FeedbackType::kTransferProgress && event.data["progress"] == 1.0) {
                ++n;
            }
        }
        return n;
    }

    net::io_context ioc_;
    TempDir dir_;
    TransferGate sender_gate_;
    TransferGate receiver_gate_;
    FeedbackLog sender_log_;
    FeedbackLog receiver_log_;
    std::unique_ptr<TransferServer> server_;
    std::unique_ptr<TransferClient> client_;
};

} // namespace

TEST(TransferSessionStateTest, TransitionTable) {
    using S = SessionState;
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kIdle, S::kRequestSent));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kIdle, S::kRequestReceived));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kRequestSent, S::kAccepted));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kRequestReceived, S::kRejected));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kAccepted, S::kStreaming));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kStreaming, S::kFinishing));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kStreaming, S::kCancelled));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kFinishing, S::kCompleted));
    EXPECT_TRUE(TransferSession::IsTransitionAllowed(S::kRequestSent, S::kFailed));

    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kIdle, S::kStreaming));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kRequestSent, S::kCancelled));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kStreaming, S::kCompleted));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kFinishing, S::kCancelled));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kCompleted, S::kFailed));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kRejected, S::kAccepted));
    EXPECT_FALSE(TransferSession::IsTransitionAllowed(S::kCancelled, S::kFailed));
}

TEST_F(TransferSessionTest, SendsFilesAndDirectories) {
    const auto big = MakeContent(200 * 1024, 1);
    const auto small = MakeContent(1000, 2);
    WriteFile(outbox() / "big.bin", big);
    WriteFile(outbox() / "album" / "photo.jpg", small);
    WriteFile(outbox() / "album" / "empty.txt", "");
    fs::create_directories(outbox() / "album" / "nothing");

    StartServer();
    auto entries = CollectEntries({outbox() / "big.bin", outbox() / "album"});
    auto task_id = client().SendFiles(Receiver(server_->port()), entries);
    EXPECT_FALSE(task_id.empty());

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_) && Terminal(receiver_log_); }));
    ASSERT_TRUE(sender_log_.has(FeedbackType::kTransferCompleted));
    ASSERT_TRUE(receiver_log_.has(FeedbackType::kTransferCompleted));

    EXPECT_EQ(ReadFile(inbox() / "big.bin"), big);
    EXPECT_EQ(ReadFile(inbox() / "album" / "photo.jpg"), small);
    EXPECT_TRUE(fs::is_regular_file(inbox() / "album" / "empty.txt"));
    EXPECT_EQ(fs::file_size(inbox() / "album" / "empty.txt"), 0u);
    EXPECT_TRUE(fs::is_directory(inbox() / "album" / "nothing"));

    EXPECT_EQ(sender_log_.count(FeedbackType::kTransferAccepted), 1u);
    EXPECT_EQ(receiver_log_.count(FeedbackType::kTransferRequested), 1u);
    EXPECT_EQ(FullProgressReports(sender_log_), 1u);
    EXPECT_EQ(FullProgressReports(receiver_log_), 1u);

    auto requested = receiver_log_.first(FeedbackType::kTransferRequested);
    EXPECT_EQ(requested["task"]["task_id"], task_id);
    EXPECT_EQ(requested["task"]["device_id"], "sender-device");
    EXPECT_EQ(requested["task"]["total_size"], big.size() + small.size());
    EXPECT_TRUE(requested["auto_accepted"].get<bool>());

    auto completed = sender_log_.first(FeedbackType::kTransferCompleted);
    EXPECT_EQ(completed["task"]["status"], "completed");
    EXPECT_EQ(completed["task"]["transferred_size"], big.size() + small.size());

    RunUntil(ioc_, [&] { return client().session_count() == 0 && server_->session_count() == 0; }, 1s);
    EXPECT_EQ(client().session_count(), 0u);
    EXPECT_EQ(server_->session_count(), 0u);
    EXPECT_FALSE(sender_gate_.busy());
    EXPECT_FALSE(receiver_gate_.busy());
}

TEST_F(TransferSessionTest, ReceiverRejectsRequest) {
    StartServer(false);
    auto entries = OneFile(4096);
    auto task_id = client().SendFiles(Receiver(server_->port()), entries);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return receiver_log_.has(FeedbackType::kTransferRequested); }));
    EXPECT_FALSE(receiver_log_.first(FeedbackType::kTransferRequested)["auto_accepted"].get<bool>());
    EXPECT_TRUE(server_->Respond(task_id, false, "no thanks"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_) && Terminal(receiver_log_); }));
    auto rejected = sender_log_.first(FeedbackType::kTransferRejected);
    EXPECT_EQ(rejected["task_id"], task_id);
    EXPECT_EQ(rejected["reason"], "no thanks");
    EXPECT_TRUE(receiver_log_.has(FeedbackType::kTransferRejected));
    EXPECT_FALSE(sender_log_.has(FeedbackType::kTransferAccepted));
    EXPECT_FALSE(fs::exists(inbox()));
}

TEST_F(TransferSessionTest, ReceiverAcceptsOnRequest) {
    StartServer(false);
    auto entries = OneFile(4096);
    auto task_id = client().SendFiles(Receiver(server_->port()), entries);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return receiver_log_.has(FeedbackType::kTransferRequested); }));
    EXPECT_FALSE(server_->Respond("unknown-task", true));
    EXPECT_TRUE(server_->Respond(task_id, true));
    EXPECT_FALSE(server_->Respond(task_id, true));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_) && Terminal(receiver_log_); }));
    EXPECT_TRUE(sender_log_.has(FeedbackType::kTransferCompleted));
    EXPECT_EQ(fs::file_size(inbox() / "payload.bin"), 4096u);
}

TEST_F(TransferSessionTest, UnansweredRequestTimesOut) {
    StartServer(false);
    server_->SetConfirmTimeout(100ms);
    client().SendFiles(Receiver(server_->port()), OneFile(100));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_); }));
    EXPECT_EQ(sender_log_.first(FeedbackType::kTransferRejected)["reason"], "confirmation timed out");
    EXPECT_FALSE(fs::exists(inbox()));
}

TEST_F(TransferSessionTest, BusyReceiverRejects) {
    StartServer();
    ASSERT_TRUE(receiver_gate_.TryAcquire("other-transfer"));
    client().SendFiles(Receiver(server_->port()), OneFile(100));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_) && Terminal(receiver_log_); }));
    EXPECT_EQ(sender_log_.first(FeedbackType::kTransferRejected)["reason"], "receiver busy");
    EXPECT_FALSE(receiver_log_.has(FeedbackType::kTransferRequested));
    EXPECT_EQ(receiver_gate_.owner(), "other-transfer");
}

TEST_F(TransferSessionTest, BusySenderFailsWithoutConnecting) {
    StartServer();
    ASSERT_TRUE(sender_gate_.TryAcquire("other-transfer"));
    client().SendFiles(Receiver(server_->port()), OneFile(100));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_); }));
    auto error = sender_log_.first(FeedbackType::kTransferError);
    EXPECT_EQ(error["kind"], "transport");
    EXPECT_EQ(error["status"], "failed");
    EXPECT_EQ(error["error_message"], "another transfer is active");

    RunUntil(ioc_, [] { return false; }, 100ms);
    EXPECT_TRUE(receiver_log_.events.empty());
    EXPECT_EQ(sender_gate_.owner(), "other-transfer");
}

TEST_F(TransferSessionTest, UnreachablePeerFails) {
    tcp::acceptor closed(ioc_, tcp::endpoint(tcp::v4(), 0));
    auto port = closed.local_endpoint().port();
    closed.close();

    client().SendFiles(Receiver(port), OneFile(100));
    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_); }));
    EXPECT_EQ(sender_log_.first(FeedbackType::kTransferError)["kind"], "transport");
    EXPECT_FALSE(sender_gate_.busy());
}

TEST_F(TransferSessionTest, AcceptsFramesFromRawPeer) {
    StartServer();
    const auto content = MakeContent(1536);
    RawExchange exchange;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("raw-task", SingleFile("a.bin", 1536), 1536),
                            {content.substr(0, 512), content.substr(512, 512), content.substr(1024)},
                            true,
                            &exchange),
                  net::detached);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return exchange.done && Terminal(receiver_log_); }));
    EXPECT_FALSE(exchange.error) << exchange.error.message();
    EXPECT_TRUE(json::parse(exchange.response)["accepted"].get<bool>());
    auto ack = json::parse(exchange.ack);
    EXPECT_EQ(ack["kind"], "transfer_ack");
    EXPECT_TRUE(ack["success"].get<bool>());

    auto completed = receiver_log_.first(FeedbackType::kTransferCompleted);
    EXPECT_EQ(completed["task"]["task_id"], "raw-task");
    EXPECT_EQ(completed["task"]["device_name"], "raw peer");
    EXPECT_EQ(completed["task"]["direction"], "receive");
    EXPECT_EQ(ReadFile(inbox() / "a.bin"), content);
}

TEST_F(TransferSessionTest, ReceiverCancelKeepsWrittenPrefix) {
    StartServer();
    const auto content = MakeContent(1536);
    RawExchange exchange;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("raw-task", SingleFile("a.bin", 1536), 1536),
                            {content.substr(0, 512)},
                            false,
                            &exchange),
                  net::detached);

    ASSERT_TRUE(RunUntil(ioc_, [&] {
        auto task = server_->GetTask("raw-task");
        return task && task->transferred_size == 512;
    }));
    EXPECT_TRUE(server_->Cancel("raw-task"));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return exchange.done && Terminal(receiver_log_); }));
    auto error = receiver_log_.first(FeedbackType::kTransferError);
    EXPECT_EQ(error["kind"], "cancelled");
    EXPECT_EQ(error["status"], "cancelled");
    EXPECT_FALSE(receiver_log_.has(FeedbackType::kTransferCompleted));
    EXPECT_EQ(fs::file_size(inbox() / "a.bin"), 512u);
    EXPECT_TRUE(exchange.error);
    EXPECT_FALSE(receiver_gate_.busy());
}

TEST_F(TransferSessionTest, DuplicateTaskIdIsRefusedWhileBusy) {
    StartServer();
    const auto content = MakeContent(1536);
    RawExchange first;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("dup-task", SingleFile("a.bin", 1536), 1536),
                            {content.substr(0, 512)},
                            false,
                            &first),
                  net::detached);
    ASSERT_TRUE(RunUntil(ioc_, [&] {
        auto task = server_->GetTask("dup-task");
        return task && task->transferred_size == 512;
    }));

    RawExchange second;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("dup-task", SingleFile("b.bin", 4), 4),
                            {"abcd"},
                            true,
                            &second),
                  net::detached);
    ASSERT_TRUE(RunUntil(ioc_, [&] { return second.done; }));

    auto response = json::parse(second.response);
    EXPECT_FALSE(response["accepted"].get<bool>());
    EXPECT_EQ(response["reason"], "receiver busy");
    EXPECT_FALSE(fs::exists(inbox() / "b.bin"));
    EXPECT_EQ(receiver_log_.first(FeedbackType::kTransferRejected)["reason"], "receiver busy");
    // the refused duplicate must leave the slot with the transfer that holds it
    EXPECT_TRUE(receiver_gate_.busy());
    EXPECT_EQ(receiver_gate_.owner(), "dup-task");
    EXPECT_FALSE(first.done);

    EXPECT_TRUE(server_->Cancel("dup-task"));
    ASSERT_TRUE(RunUntil(ioc_, [&] {
        return first.done && receiver_log_.has(FeedbackType::kTransferError);
    }));
    EXPECT_EQ(receiver_log_.first(FeedbackType::kTransferError)["status"], "cancelled");
    EXPECT_EQ(fs::file_size(inbox() / "a.bin"), 512u);
    EXPECT_FALSE(receiver_gate_.busy());
}

TEST_F(TransferSessionTest, SenderCancelMidStream) {
    tcp::acceptor acceptor(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    net::steady_timer release(ioc_, std::chrono::hours(1));
    net::co_spawn(ioc_, StallingReceiver(&acceptor, &release), net::detached);

    auto task_id = client().SendFiles(Receiver(acceptor.local_endpoint().port()),
                                      OneFile(32 * 1024 * 1024));
    ASSERT_TRUE(RunUntil(ioc_, [&] { return sender_log_.has(FeedbackType::kTransferAccepted); }));
    RunUntil(ioc_, [] { return false; }, 200ms);
    auto task = client().GetTask(task_id);
    ASSERT_TRUE(task.has_value());
    ASSERT_EQ(task->status, TransferStatus::kTransferring);
    EXPECT_TRUE(client().Cancel(task_id));

    ASSERT_TRUE(RunUntil(ioc_, [&] { return Terminal(sender_log_); }));
    auto error = sender_log_.first(FeedbackType::kTransferError);
    EXPECT_EQ(error["task_id"], task_id);
    EXPECT_EQ(error["kind"], "cancelled");
    EXPECT_EQ(error["status"], "cancelled");
    EXPECT_FALSE(sender_log_.has(FeedbackType::kTransferCompleted));
    EXPECT_FALSE(sender_gate_.busy());
    EXPECT_FALSE(client().Cancel(task_id));

    release.cancel();
    RunUntil(ioc_, [] { return false; }, 50ms);
}

TEST_F(TransferSessionTest, MalformedRequestIsRefused) {
    StartServer();
    RawExchange exchange;
    net::co_spawn(ioc_, RawSender(server_->port(), "{not json\n", {}, false, &exchange), net::detached);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return exchange.done && Terminal(receiver_log_); }));
    auto response = json::parse(exchange.response);
    EXPECT_EQ(response["kind"], "transfer_response");
    EXPECT_FALSE(response["accepted"].get<bool>());
    auto error = receiver_log_.first(FeedbackType::kTransferError);
    EXPECT_EQ(error["kind"], "protocol");
    EXPECT_EQ(error["status"], "failed");
    EXPECT_FALSE(receiver_log_.has(FeedbackType::kTransferRequested));
}

TEST_F(TransferSessionTest, ServerKeepsServingAfterRefusedRequests) {
    StartServer();
    RawExchange malformed;
    net::co_spawn(ioc_, RawSender(server_->port(), "{not json\n", {}, false, &malformed), net::detached);
    ASSERT_TRUE(RunUntil(ioc_, [&] { return malformed.done; }));
    EXPECT_FALSE(json::parse(malformed.response)["accepted"].get<bool>());

    RawExchange mismatch;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("bad-size", SingleFile("a.bin", 5), 10),
                            {},
                            false,
                            &mismatch),
                  net::detached);
    ASSERT_TRUE(RunUntil(ioc_, [&] { return mismatch.done; }));
    EXPECT_FALSE(json::parse(mismatch.response)["accepted"].get<bool>());
    EXPECT_FALSE(receiver_gate_.busy());

    RawExchange good;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("good-task", SingleFile("ok.bin", 4), 4),
                            {"abcd"},
                            true,
                            &good),
                  net::detached);
    ASSERT_TRUE(RunUntil(ioc_, [&] {
        return good.done && receiver_log_.has(FeedbackType::kTransferCompleted);
    }));
    EXPECT_FALSE(good.error) << good.error.message();
    EXPECT_TRUE(json::parse(good.ack)["success"].get<bool>());
    EXPECT_EQ(ReadFile(inbox() / "ok.bin"), "abcd");
    EXPECT_FALSE(receiver_gate_.busy());
}

TEST_F(TransferSessionTest, SizeMismatchIsRefused) {
    StartServer();
    RawExchange exchange;
    net::co_spawn(ioc_,
                  RawSender(server_->port(),
                            RequestLine("raw-task", SingleFile("a.bin", 5), 10),
                            {},
                            false,
                            &exchange),
                  net::detached);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return exchange.done && Terminal(receiver_log_); }));
    EXPECT_FALSE(json::parse(exchange.response)["accepted"].get<bool>());
    EXPECT_EQ(receiver_log_.first(FeedbackType::kTransferError)["kind"], "protocol");
    EXPECT_FALSE(fs::exists(inbox()));
}

TEST_F(TransferSessionTest, TraversalManifestIsRefused) {
    StartServer();
    auto files = json::array({{{"name", "evil"},
                               {"size", 4},
                               {"isDirectory", false},
                               {"relativePath", "../evil"}}});
    RawExchange exchange;
    net::co_spawn(ioc_,
                  RawSender(server_->port(), RequestLine("raw-task", files, 4), {"evil"}, true, &exchange),
                  net::detached);

    ASSERT_TRUE(RunUntil(ioc_, [&] { return exchange.done && Terminal(receiver_log_); }));
    EXPECT_FALSE(json::parse(exchange.response)["accepted"].get<bool>());
    EXPECT_EQ(receiver_log_.first(FeedbackType::kTransferError)["kind"], "protocol");
    EXPECT_FALSE(fs::exists(dir_ / "evil"));
    EXPECT_FALSE(fs::exists(inbox()));
}

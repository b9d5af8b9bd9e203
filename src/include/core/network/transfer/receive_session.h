#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/constant/transfer.h>
#include <core/network/transfer/transfer_session.h>
#include <core/transfer/file_receiver.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace landrop::core {

struct ReceiveOptions {
    std::filesystem::path save_dir;
    bool auto_accept = true;
    std::chrono::steady_clock::duration confirm_timeout = transfer::kDefaultConfirmTimeout;
};

// Responder role for one accepted connection. Nothing touches the filesystem before the request
// has been accepted, either by policy or through Respond().
class ReceiveSession : public TransferSession {
public:
    ReceiveSession(boost::asio::ip::tcp::socket socket,
                   TransferGate& gate,
                   ReceiveOptions options,
                   FeedbackCallback callback = nullptr);

    // Never throws: every failure ends in a terminal state reported through feedback
    boost::asio::awaitable<void> Run();

    // Decision for a request that is waiting for the user. Returns false if none is pending.
    bool Respond(bool accepted, std::string reason = {});

    // While the request waits for a decision, cancelling rejects it
    bool Cancel() override;

    bool waiting_for_decision() const { return waiting_for_decision_; }

private:
    struct Decision {
        bool accepted;
        std::string reason;
    };

    boost::asio::awaitable<void> converse();
    boost::asio::awaitable<Decision> waitForDecision();
    boost::asio::awaitable<void> receiveFrames();
    boost::asio::awaitable<void> consumeFrame(std::uint32_t length);
    boost::asio::awaitable<void> abort(const TransferError& error);
    boost::asio::awaitable<void> tryWriteRecord(const nlohmann::json& record);

    ReceiveOptions options_;
    boost::asio::steady_timer confirm_timer_;
    std::optional<Decision> decision_;
    bool waiting_for_decision_{false};
    std::unique_ptr<FileReceiver> receiver_;
};

} // namespace landrop::core

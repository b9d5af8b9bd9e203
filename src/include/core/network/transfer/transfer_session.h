#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <core/model/feedback.h>
#include <core/model/session_state.h>
#include <core/model/transfer_task.h>
#include <core/transfer/progress_tracker.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/transfer_gate.h>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace landrop::core {

enum class SessionRole {
    kInitiator, // sender
    kResponder, // receiver
};

// One file-transfer conversation over a TCP connection.
//
// The state machine is shared by both roles:
//   Idle -> RequestSent | RequestReceived -> Accepted -> Streaming -> Finishing -> Completed
// with Rejected after a negative response, Cancelled from Accepted/Streaming on local user action
// and Failed from any non-terminal state. Every terminal state is reported exactly once through
// the feedback callback and releases the transfer gate.
class TransferSession {
public:
    using FinishedCallback = std::function<void(const std::string& task_id)>;

    TransferSession(SessionRole role,
                    boost::asio::ip::tcp::socket socket,
                    TransferGate& gate,
                    FeedbackCallback callback);
    virtual ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // User cancellation. Returns false if the session is past the point where it can be cancelled.
    virtual bool Cancel();

    const TransferTask& task() const { return task_; }
    const std::string& task_id() const { return task_.task_id; }
    SessionState state() const { return state_; }
    SessionRole role() const { return role_; }

    // Invoked once after the terminal state was reported, the owner drops the session here
    void SetFinishedCallback(FinishedCallback callback) { finished_callback_ = std::move(callback); }

    static bool IsTransitionAllowed(SessionState from, SessionState to);

protected:
    // Throws std::logic_error on a transition the state machine does not allow
    void transitTo(SessionState state);

    // Takes the process-wide transfer slot; only a session that got it releases it
    bool acquireGate();

    void addTransferred(std::uint64_t bytes);

    // Terminal helpers, each one is a no-op once the session is terminal
    void complete();
    void reject(const std::string& reason);
    void fail(ErrorKind kind, const std::string& message);
    void cancelled();

    // Routes an error that ended the conversation: a cancel request in flight turns it into
    // Cancelled (or a cancelled failure before acceptance), anything else into Failed
    void handleError(const TransferError& error);

    // Control records are newline-terminated JSON objects of at most kMaxControlRecordSize bytes.
    // Throws TransferError(kProtocol) on a malformed or oversized record and
    // boost::system::system_error on transport failure; nullopt on a clean close before any byte.
    boost::asio::awaitable<std::optional<nlohmann::json>> readRecord();
    boost::asio::awaitable<void> writeRecord(const nlohmann::json& record);

    // Makes at least n bytes available in inbound_
    boost::asio::awaitable<void> fill(std::size_t n);

    void closeSocket();
    void feedback(Feedback&& feedback);

    SessionRole role_;
    boost::asio::ip::tcp::socket socket_;
    TransferGate& gate_;
    TransferTask task_;
    SessionState state_{SessionState::kIdle};
    ProgressTracker progress_;
    bool cancel_requested_{false};
    bool holds_gate_{false};
    std::string inbound_; // bytes read from the socket and not consumed yet

private:
    void finish(); // shared tail of the terminal helpers

    FeedbackCallback callback_;
    FinishedCallback finished_callback_;
};

} // namespace landrop::core

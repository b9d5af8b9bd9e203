#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <core/constant/transfer.h>
#include <core/network/transfer/transfer_session.h>
#include <core/util/wire_format.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace net = boost::asio;
using json = nlohmann::json;

namespace landrop::core {

namespace {

TransferStatus StatusOf(SessionState state) {
    switch (state) {
    case SessionState::kIdle:
        return TransferStatus::kPending;
    case SessionState::kRequestSent:
    case SessionState::kRequestReceived:
        return TransferStatus::kAwaitingAcceptance;
    case SessionState::kAccepted:
    case SessionState::kStreaming:
    case SessionState::kFinishing:
        return TransferStatus::kTransferring;
    case SessionState::kCompleted:
        return TransferStatus::kCompleted;
    case SessionState::kRejected:
        return TransferStatus::kRejected;
    case SessionState::kFailed:
        return TransferStatus::kFailed;
    case SessionState::kCancelled:
        return TransferStatus::kCancelled;
    }
    return TransferStatus::kFailed;
}

} // namespace

TransferSession::TransferSession(SessionRole role,
                                 net::ip::tcp::socket socket,
                                 TransferGate& gate,
                                 FeedbackCallback callback)
    : role_(role)
    , socket_(std::move(socket))
    , gate_(gate)
    , callback_(std::move(callback)) {
    task_.direction = role == SessionRole::kInitiator ? TransferDirection::kOutbound
                                                      : TransferDirection::kInbound;
}

TransferSession::~TransferSession() {
    closeSocket();
}

bool TransferSession::IsTransitionAllowed(SessionState from, SessionState to) {
    if (IsTerminal(from)) {
        return false;
    }
    if (to == SessionState::kFailed) {
        return true;
    }
    switch (from) {
    case SessionState::kIdle:
        return to == SessionState::kRequestSent || to == SessionState::kRequestReceived;
    case SessionState::kRequestSent:
    case SessionState::kRequestReceived:
        return to == SessionState::kAccepted || to == SessionState::kRejected;
    case SessionState::kAccepted:
        return to == SessionState::kStreaming || to == SessionState::kCancelled;
    case SessionState::kStreaming:
        return to == SessionState::kFinishing || to == SessionState::kCancelled;
    case SessionState::kFinishing:
        return to == SessionState::kCompleted;
    default:
        return false;
    }
}

void TransferSession::transitTo(SessionState state) {
    if (!IsTransitionAllowed(state_, state)) {
        throw std::logic_error(fmt::format("illegal session transition {} -> {}",
                                           json(state_).get<std::string>(),
                                           json(state).get<std::string>()));
    }
    spdlog::debug("Session {}: {} -> {}",
                  task_.task_id,
                  json(state_).get<std::string>(),
                  json(state).get<std::string>());
    state_ = state;
    task_.status = StatusOf(state);
}

bool TransferSession::Cancel() {
    if (IsTerminal(state_) || state_ == SessionState::kFinishing) {
        return false;
    }
    spdlog::info("Cancelling transfer {}", task_.task_id);
    cancel_requested_ = true;
    closeSocket();
    return true;
}

bool TransferSession::acquireGate() {
    holds_gate_ = gate_.TryAcquire(task_.task_id);
    return holds_gate_;
}

void TransferSession::addTransferred(std::uint64_t bytes) {
    task_.transferred_size += bytes;
    if (progress_.Add(bytes)) {
        task_.throughput = progress_.throughput();
        feedback(Feedback{
            .type = FeedbackType::kTransferProgress,
            .data = feedback::TransferProgress{
                .task_id = task_.task_id,
                .transferred = progress_.transferred(),
                .total = progress_.total(),
                .throughput = progress_.throughput(),
                .progress = progress_.fraction(),
            },
        });
    }
}

void TransferSession::complete() {
    if (IsTerminal(state_)) {
        return;
    }
    transitTo(SessionState::kCompleted);
    if (progress_.Finish()) {
        // nothing was streamed, the only 100% report is this one
        feedback(Feedback{
            .type = FeedbackType::kTransferProgress,
            .data = feedback::TransferProgress{
                .task_id = task_.task_id,
                .transferred = progress_.transferred(),
                .total = progress_.total(),
                .throughput = progress_.throughput(),
                .progress = progress_.fraction(),
            },
        });
    }
    task_.throughput = progress_.throughput();
    spdlog::info("Transfer {} completed ({} bytes)", task_.task_id, task_.transferred_size);
    feedback(Feedback{
        .type = FeedbackType::kTransferCompleted,
        .data = feedback::TransferCompleted{.task = task_},
    });
    finish();
}

void TransferSession::reject(const std::string& reason) {
    if (IsTerminal(state_)) {
        return;
    }
    transitTo(SessionState::kRejected);
    spdlog::info("Transfer {} rejected: {}", task_.task_id, reason);
    feedback(Feedback{
        .type = FeedbackType::kTransferRejected,
        .data = feedback::TransferRejected{
            .task_id = task_.task_id,
            .device_id = task_.device_id,
            .reason = reason,
        },
    });
    finish();
}

void TransferSession::fail(ErrorKind kind, const std::string& message) {
    if (IsTerminal(state_)) {
        return;
    }
    transitTo(SessionState::kFailed);
    spdlog::error("Transfer {} failed ({}): {}", task_.task_id, ErrorKindToString(kind), message);
    feedback(Feedback{
        .type = FeedbackType::kTransferError,
        .data = feedback::TransferError{
            .task_id = task_.task_id,
            .kind = kind,
            .status = TransferStatus::kFailed,
            .error_message = message,
        },
    });
    finish();
}

void TransferSession::cancelled() {
    if (IsTerminal(state_)) {
        return;
    }
    transitTo(SessionState::kCancelled);
    spdlog::info("Transfer {} cancelled after {} bytes", task_.task_id, task_.transferred_size);
    feedback(Feedback{
        .type = FeedbackType::kTransferError,
        .data = feedback::TransferError{
            .task_id = task_.task_id,
            .kind = ErrorKind::kCancelled,
            .status = TransferStatus::kCancelled,
            .error_message = "cancelled by user",
        },
    });
    finish();
}

void TransferSession::handleError(const TransferError& error) {
    if (cancel_requested_) {
        if (state_ == SessionState::kAccepted || state_ == SessionState::kStreaming) {
            cancelled();
        } else {
            fail(ErrorKind::kCancelled, "cancelled before the transfer started");
        }
        return;
    }
    fail(error.kind(), error.what());
}

void TransferSession::finish() {
    closeSocket();
    if (holds_gate_) {
        gate_.Release(task_.task_id);
        holds_gate_ = false;
    }
    if (finished_callback_) {
        // the owner may destroy us from here, nothing may follow this call
        auto callback = std::move(finished_callback_);
        callback(task_.task_id);
    }
}

net::awaitable<std::optional<json>> TransferSession::readRecord() {
    std::size_t length = 0;
    try {
        length = co_await net::async_read_until(socket_,
                                                net::dynamic_buffer(inbound_,
                                                                    transfer::kMaxControlRecordSize),
                                                '\n',
                                                net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        if (e.code() == net::error::not_found) {
            throw ProtocolError("control record exceeds the size limit");
        }
        if (e.code() == net::error::eof && inbound_.empty()) {
            co_return std::nullopt;
        }
        throw;
    }

    auto record = ParseRecord(std::string_view(inbound_).substr(0, length));
    inbound_.erase(0, length);
    if (!record) {
        throw ProtocolError("malformed control record");
    }
    co_return record;
}

net::awaitable<void> TransferSession::writeRecord(const json& record) {
    auto line = EncodeRecord(record);
    co_await net::async_write(socket_, net::buffer(line), net::use_awaitable);
}

net::awaitable<void> TransferSession::fill(std::size_t n) {
    if (inbound_.size() >= n) {
        co_return;
    }
    co_await net::async_read(socket_,
                             net::dynamic_buffer(inbound_),
                             net::transfer_at_least(n - inbound_.size()),
                             net::use_awaitable);
}

void TransferSession::closeSocket() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(net::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Error closing transfer socket: {}", ec.message());
    }
}

void TransferSession::feedback(Feedback&& feedback) {
    if (callback_) {
        callback_(std::move(feedback));
    }
}

} // namespace landrop::core

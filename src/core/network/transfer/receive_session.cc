#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/model/dto/transfer_ack_dto.h>
#include <core/model/dto/transfer_request_dto.h>
#include <core/model/dto/transfer_response_dto.h>
#include <core/network/transfer/receive_session.h>
#include <core/util/wire_format.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace landrop::core {

namespace {

constexpr const char* kReceiverBusy = "receiver busy";
constexpr const char* kConfirmationTimedOut = "confirmation timed out";
constexpr const char* kCancelledByReceiver = "cancelled by receiver";

} // namespace

ReceiveSession::ReceiveSession(tcp::socket socket,
                               TransferGate& gate,
                               ReceiveOptions options,
                               FeedbackCallback callback)
    : TransferSession(SessionRole::kResponder, std::move(socket), gate, std::move(callback))
    , options_(std::move(options))
    , confirm_timer_(socket_.get_executor()) {
    // Placeholder identity until the request names the initiator's task
    boost::uuids::random_generator uuid_gen;
    task_.task_id = boost::uuids::to_string(uuid_gen());

    boost::system::error_code ec;
    auto remote = socket_.remote_endpoint(ec);
    if (!ec) {
        task_.peer_address = remote.address().to_string();
    }
}

net::awaitable<void> ReceiveSession::Run() {
    task_.start_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();

    std::optional<TransferError> error;
    try {
        co_await converse();
    } catch (const TransferError& e) {
        error = e;
    } catch (const boost::system::system_error& e) {
        error = TransferError(ErrorKind::kTransport, e.code().message());
    } catch (const json::exception& e) {
        error = ProtocolError(e.what());
    }
    if (error) {
        co_await abort(*error);
    }
}

bool ReceiveSession::Respond(bool accepted, std::string reason) {
    if (!waiting_for_decision_ || decision_) {
        return false;
    }
    if (!accepted && reason.empty()) {
        reason = "rejected by receiver";
    }
    decision_ = Decision{accepted, std::move(reason)};
    confirm_timer_.cancel();
    return true;
}

bool ReceiveSession::Cancel() {
    if (waiting_for_decision_) {
        return Respond(false, kCancelledByReceiver);
    }
    if (!TransferSession::Cancel()) {
        return false;
    }
    if (receiver_) {
        receiver_->Close();
    }
    return true;
}

net::awaitable<void> ReceiveSession::converse() {
    auto record = co_await readRecord();
    if (!record) {
        throw TransferError(ErrorKind::kTransport, "connection closed before a request arrived");
    }

    TransferRequestDto request;
    try {
        record->get_to(request);
    } catch (const std::exception& e) {
        throw ProtocolError(fmt::format("invalid transfer request: {}", e.what()));
    }

    if (request.task_id && !request.task_id->empty()) {
        task_.task_id = *request.task_id;
    }
    task_.device_id = request.sender_id.value_or("");
    task_.device_name = request.sender_name.value_or("");
    if (task_.device_id.empty()) {
        task_.device_id = task_.peer_address;
    }
    if (task_.device_name.empty()) {
        task_.device_name = task_.peer_address;
    }
    task_.total_size = request.total_size;
    task_.files = std::move(request.files);

    if (TotalSize(task_.files) != task_.total_size) {
        throw ProtocolError(fmt::format("declared total size {} does not match the manifest ({})",
                                        task_.total_size,
                                        TotalSize(task_.files)));
    }
    // Resolves every path, a traversal attempt fails here before any handle exists
    receiver_ = std::make_unique<FileReceiver>(options_.save_dir, task_.files);

    transitTo(SessionState::kRequestReceived);
    spdlog::info("Transfer request {} from {} ({}): {} entries, {} bytes",
                 task_.task_id,
                 task_.device_name,
                 task_.peer_address,
                 task_.files.size(),
                 task_.total_size);

    if (!acquireGate()) {
        json busy = TransferResponseDto{.accepted = false, .reason = kReceiverBusy};
        co_await writeRecord(busy);
        reject(kReceiverBusy);
        co_return;
    }

    feedback(Feedback{
        .type = FeedbackType::kTransferRequested,
        .data = feedback::TransferRequested{.task = task_, .auto_accepted = options_.auto_accept},
    });

    Decision decision{true, {}};
    if (!options_.auto_accept) {
        decision = co_await waitForDecision();
    }

    TransferResponseDto response{.accepted = decision.accepted};
    if (!decision.accepted) {
        response.reason = decision.reason;
    }
    json response_record = response;
    co_await writeRecord(response_record);
    if (!decision.accepted) {
        reject(decision.reason);
        co_return;
    }

    transitTo(SessionState::kAccepted);
    receiver_->Open();
    co_await receiveFrames();

    transitTo(SessionState::kFinishing);
    receiver_->Finish();
    json ack = TransferAckDto{.success = true};
    co_await writeRecord(ack);
    complete();
}

net::awaitable<ReceiveSession::Decision> ReceiveSession::waitForDecision() {
    waiting_for_decision_ = true;
    if (!decision_) {
        confirm_timer_.expires_after(options_.confirm_timeout);
        boost::system::error_code ec;
        co_await confirm_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    waiting_for_decision_ = false;

    if (decision_) {
        co_return *decision_;
    }
    spdlog::info("Transfer request {} was not answered in time", task_.task_id);
    co_return Decision{false, kConfirmationTimedOut};
}

net::awaitable<void> ReceiveSession::receiveFrames() {
    transitTo(SessionState::kStreaming);
    progress_ = ProgressTracker(task_.total_size);
    progress_.Start();

    for (;;) {
        co_await fill(kFrameHeaderSize);
        auto length = DecodeFrameHeader(reinterpret_cast<const std::uint8_t*>(inbound_.data()));
        inbound_.erase(0, kFrameHeaderSize);

        if (length == kEndOfTransfer) {
            co_return;
        }
        if (length > transfer::kMaxChunkSize) {
            throw ProtocolError(fmt::format("chunk of {} bytes exceeds the frame limit", length));
        }
        co_await consumeFrame(length);
    }
}

net::awaitable<void> ReceiveSession::consumeFrame(std::uint32_t length) {
    // Applied as it arrives, wire segmentation never matches the sender's frames
    std::uint64_t remaining = length;
    while (remaining > 0) {
        if (inbound_.empty()) {
            co_await fill(1);
        }
        auto size = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, inbound_.size()));
        receiver_->Write(reinterpret_cast<const std::uint8_t*>(inbound_.data()), size);
        inbound_.erase(0, size);
        remaining -= size;
        addTransferred(size);
    }
}

net::awaitable<void> ReceiveSession::abort(const TransferError& error) {
    if (receiver_) {
        receiver_->Close();
    }

    if (!cancel_requested_ && error.kind() != ErrorKind::kTransport && socket_.is_open()) {
        // built outside the co_await expression, no temporary may span the suspension
        json record;
        if (state_ == SessionState::kIdle || state_ == SessionState::kRequestReceived) {
            record = TransferResponseDto{.accepted = false, .reason = error.what()};
        } else {
            record = TransferAckDto{.success = false, .reason = error.what()};
        }
        co_await tryWriteRecord(record);
    }
    handleError(error);
}

net::awaitable<void> ReceiveSession::tryWriteRecord(const json& record) {
    auto line = EncodeRecord(record);
    boost::system::error_code ec;
    co_await net::async_write(socket_,
                              net::buffer(line),
                              net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        spdlog::debug("Could not deliver {} to {}: {}",
                      record.value("kind", "record"),
                      task_.peer_address,
                      ec.message());
    }
}

} // namespace landrop::core

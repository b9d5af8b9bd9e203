#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <core/model/dto/transfer_ack_dto.h>
#include <core/model/dto/transfer_request_dto.h>
#include <core/model/dto/transfer_response_dto.h>
#include <core/network/transfer/send_session.h>
#include <core/transfer/file_source.h>
#include <core/util/wire_format.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace landrop::core {

SendSession::SendSession(net::io_context& ioc,
                         TransferGate& gate,
                         const DeviceInfo& local,
                         const DeviceInfo& peer,
                         std::vector<FileEntry> entries,
                         FeedbackCallback callback)
    : TransferSession(SessionRole::kInitiator, tcp::socket(ioc), gate, std::move(callback))
    , local_id_(local.device_id)
    , local_name_(local.device_name)
    , peer_port_(peer.port) {
    boost::uuids::random_generator uuid_gen;
    task_.task_id = boost::uuids::to_string(uuid_gen());
    task_.device_id = peer.device_id;
    task_.device_name = peer.device_name;
    task_.peer_address = peer.ip_address;
    task_.total_size = TotalSize(entries);
    task_.files = std::move(entries);
}

net::awaitable<void> SendSession::Run() {
    task_.start_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();

    if (!acquireGate()) {
        fail(ErrorKind::kTransport, "another transfer is active");
        co_return;
    }

    spdlog::info("Sending {} entries ({} bytes) to {} at {}:{}",
                 task_.files.size(),
                 task_.total_size,
                 task_.device_name,
                 task_.peer_address,
                 peer_port_);

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
        handleError(*error);
    }
}

net::awaitable<void> SendSession::converse() {
    auto address = net::ip::make_address(task_.peer_address);
    co_await socket_.async_connect(tcp::endpoint(address, peer_port_), net::use_awaitable);

    TransferRequestDto request;
    request.task_id = task_.task_id;
    request.sender_id = local_id_;
    request.sender_name = local_name_;
    request.total_size = task_.total_size;
    request.files = task_.files;
    json request_record = request;
    co_await writeRecord(request_record);
    transitTo(SessionState::kRequestSent);

    auto record = co_await readRecord();
    if (!record) {
        throw TransferError(ErrorKind::kTransport, "connection closed before a response arrived");
    }
    TransferResponseDto response;
    try {
        record->get_to(response);
    } catch (const std::exception& e) {
        throw ProtocolError(fmt::format("invalid transfer response: {}", e.what()));
    }

    if (!response.accepted) {
        reject(response.reason.value_or("rejected by receiver"));
        co_return;
    }

    transitTo(SessionState::kAccepted);
    feedback(Feedback{
        .type = FeedbackType::kTransferAccepted,
        .data = feedback::TransferAccepted{.task_id = task_.task_id, .device_id = task_.device_id},
    });

    co_await streamFiles();

    auto ack_record = co_await readRecord();
    if (ack_record) {
        TransferAckDto ack;
        try {
            ack_record->get_to(ack);
        } catch (const std::exception& e) {
            throw ProtocolError(fmt::format("invalid transfer acknowledgment: {}", e.what()));
        }
        if (!ack.success) {
            throw ProtocolError(ack.reason.value_or("receiver reported a failure"));
        }
    }
    complete();
}

net::awaitable<void> SendSession::streamFiles() {
    transitTo(SessionState::kStreaming);
    progress_ = ProgressTracker(task_.total_size);
    progress_.Start();

    FileSource source(task_.files);
    BinaryData chunk;
    while (auto size = source.Next(chunk)) {
        auto header = EncodeFrameHeader(static_cast<std::uint32_t>(size));
        std::array<net::const_buffer, 2> frame{net::buffer(header), net::buffer(chunk.data(), size)};
        co_await net::async_write(socket_, frame, net::use_awaitable);
        addTransferred(size);
    }
    source.Close();

    auto sentinel = EncodeFrameHeader(kEndOfTransfer);
    co_await net::async_write(socket_, net::buffer(sentinel), net::use_awaitable);
    transitTo(SessionState::kFinishing);
}

} // namespace landrop::core

#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/model/device_info.h>
#include <core/model/file_entry.h>
#include <core/network/transfer/transfer_session.h>
#include <memory>
#include <vector>

namespace landrop::core {

// Initiator role: connect, send the manifest, await the decision, stream every file and finish
// with the end-of-transfer sentinel. Completes on a positive acknowledgment or a clean close.
class SendSession : public TransferSession {
public:
    SendSession(boost::asio::io_context& ioc,
                TransferGate& gate,
                const DeviceInfo& local,
                const DeviceInfo& peer,
                std::vector<FileEntry> entries,
                FeedbackCallback callback = nullptr);

    // Never throws: every failure ends in a terminal state reported through feedback
    boost::asio::awaitable<void> Run();

private:
    boost::asio::awaitable<void> converse();
    boost::asio::awaitable<void> streamFiles();

    std::string local_id_;
    std::string local_name_;
    std::uint16_t peer_port_;
};

} // namespace landrop::core

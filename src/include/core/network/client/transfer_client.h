#pragma once

#include <boost/asio/io_context.hpp>
#include <core/model/device_info.h>
#include <core/model/feedback.h>
#include <core/model/file_entry.h>
#include <core/model/transfer_task.h>
#include <core/network/transfer/send_session.h>
#include <core/transfer/transfer_gate.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace landrop::core {

// Opens outbound connections and drives an initiator session per send.
class TransferClient {
public:
    TransferClient(boost::asio::io_context& ioc,
                   TransferGate& gate,
                   DeviceInfo local,
                   FeedbackCallback callback = nullptr);
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    // Starts a transfer to peer and returns its task id at once; the outcome arrives as feedback
    std::string SendFiles(const DeviceInfo& peer, std::vector<FileEntry> entries);

    bool Cancel(std::string_view task_id);
    // Cancels every live send
    void CancelAll();

    std::optional<TransferTask> GetTask(std::string_view task_id) const;
    std::size_t session_count() const { return send_sessions_.size(); }

private:
    boost::asio::io_context& ioc_;
    TransferGate& gate_;
    DeviceInfo local_;
    FeedbackCallback callback_;

    std::unordered_map<std::string, std::shared_ptr<SendSession>> send_sessions_;
};

} // namespace landrop::core

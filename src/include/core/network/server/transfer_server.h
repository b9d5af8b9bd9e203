#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <core/model/feedback.h>
#include <core/model/transfer_task.h>
#include <core/network/transfer/receive_session.h>
#include <core/transfer/transfer_gate.h>
#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace landrop::core {

// Accepts inbound transfer connections and runs a responder session for each of them.
class TransferServer {
public:
    TransferServer(boost::asio::io_context& io_context,
                   TransferGate& gate,
                   ReceiveOptions options,
                   FeedbackCallback callback = nullptr);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Throws boost::system::system_error on bind failure. Port 0 binds an ephemeral port.
    void Start(std::uint16_t port);
    // Stops accepting and cancels every live session
    void Stop();

    bool running() const { return running_; }
    std::uint16_t port() const;

    // Apply to requests received from now on
    void SetSaveDirectory(std::filesystem::path save_dir) { options_.save_dir = std::move(save_dir); }
    void SetAutoAccept(bool auto_accept) { options_.auto_accept = auto_accept; }
    void SetConfirmTimeout(std::chrono::steady_clock::duration timeout) {
        options_.confirm_timeout = timeout;
    }
    const ReceiveOptions& options() const { return options_; }

    bool Respond(std::string_view task_id, bool accepted, std::string reason = {});
    bool Cancel(std::string_view task_id);

    std::optional<TransferTask> GetTask(std::string_view task_id) const;
    std::size_t session_count() const { return sessions_.size(); }

private:
    boost::asio::awaitable<void> acceptConnections();
    std::shared_ptr<ReceiveSession> findSession(std::string_view task_id) const;
    void removeSession(const std::string& task_id);

    boost::asio::io_context& io_context_;
    TransferGate& gate_;
    ReceiveOptions options_;
    FeedbackCallback callback_;
    boost::asio::ip::tcp::acceptor acceptor_;
    bool running_{false};

    std::list<std::shared_ptr<ReceiveSession>> sessions_;
};

} // namespace landrop::core

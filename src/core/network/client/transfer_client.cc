#include <boost/asio/co_spawn.hpp>
#include <core/network/client/transfer_client.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace landrop::core {

TransferClient::TransferClient(net::io_context& ioc,
                               TransferGate& gate,
                               DeviceInfo local,
                               FeedbackCallback callback)
    : ioc_(ioc)
    , gate_(gate)
    , local_(std::move(local))
    , callback_(std::move(callback)) {}

TransferClient::~TransferClient() {
    CancelAll();
}

std::string TransferClient::SendFiles(const DeviceInfo& peer, std::vector<FileEntry> entries) {
    auto session = std::make_shared<SendSession>(ioc_, gate_, local_, peer, std::move(entries), callback_);
    auto task_id = session->task_id();
    session->SetFinishedCallback([this](const std::string& id) { send_sessions_.erase(id); });
    send_sessions_.emplace(task_id, session);

    net::co_spawn(ioc_, session->Run(), [session](std::exception_ptr ep) {
        if (!ep) {
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("Send session {} ended abnormally: {}", session->task_id(), e.what());
        }
    });
    return task_id;
}

bool TransferClient::Cancel(std::string_view task_id) {
    auto it = send_sessions_.find(std::string(task_id));
    if (it == send_sessions_.end()) {
        spdlog::warn("No outbound transfer {} to cancel", task_id);
        return false;
    }
    return it->second->Cancel();
}

void TransferClient::CancelAll() {
    auto sessions = std::move(send_sessions_);
    send_sessions_.clear();
    for (auto& [id, session] : sessions) {
        session->SetFinishedCallback(nullptr);
        session->Cancel();
    }
}

std::optional<TransferTask> TransferClient::GetTask(std::string_view task_id) const {
    auto it = send_sessions_.find(std::string(task_id));
    if (it == send_sessions_.end()) {
        return std::nullopt;
    }
    return it->second->task();
}

} // namespace landrop::core

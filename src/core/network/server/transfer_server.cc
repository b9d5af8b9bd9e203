#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/server/transfer_server.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace landrop::core {

TransferServer::TransferServer(net::io_context& io_context,
                               TransferGate& gate,
                               ReceiveOptions options,
                               FeedbackCallback callback)
    : io_context_(io_context)
    , gate_(gate)
    , options_(std::move(options))
    , callback_(std::move(callback))
    , acceptor_(io_context) {}

TransferServer::~TransferServer() {
    Stop();
}

void TransferServer::Start(std::uint16_t port) {
    if (running_) {
        spdlog::warn("Transfer server is already running.");
        return;
    }

    tcp::endpoint endpoint(tcp::v4(), port);
    try {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        spdlog::error("Failed to start transfer server on port {}: {}", port, e.what());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        throw;
    }
    running_ = true;
    spdlog::info("Transfer server listening on port {}, saving to {}",
                 this->port(),
                 options_.save_dir.string());

    net::co_spawn(io_context_, acceptConnections(), net::detached);
}

void TransferServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    acceptor_.close(ec);

    auto sessions = std::move(sessions_);
    sessions_.clear();
    for (auto& session : sessions) {
        session->SetFinishedCallback(nullptr);
        session->Cancel();
    }
    spdlog::info("Transfer server stopped.");
}

std::uint16_t TransferServer::port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

bool TransferServer::Respond(std::string_view task_id, bool accepted, std::string reason) {
    auto session = findSession(task_id);
    if (!session) {
        spdlog::warn("No inbound transfer {} to respond to", task_id);
        return false;
    }
    return session->Respond(accepted, std::move(reason));
}

bool TransferServer::Cancel(std::string_view task_id) {
    auto session = findSession(task_id);
    if (!session) {
        return false;
    }
    return session->Cancel();
}

std::optional<TransferTask> TransferServer::GetTask(std::string_view task_id) const {
    auto session = findSession(task_id);
    if (!session) {
        return std::nullopt;
    }
    return session->task();
}

net::awaitable<void> TransferServer::acceptConnections() {
    while (running_) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec == net::error::operation_aborted || !running_) {
                break;
            }
            spdlog::warn("Failed to accept transfer connection: {}", ec.message());
            continue;
        }

        boost::system::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        spdlog::debug("Accepted transfer connection from {}",
                      remote_ec ? std::string("unknown") : remote.address().to_string());

        auto session = std::make_shared<ReceiveSession>(std::move(socket), gate_, options_, callback_);
        session->SetFinishedCallback([this](const std::string& task_id) { removeSession(task_id); });
        sessions_.push_back(session);

        net::co_spawn(io_context_, session->Run(), [session](std::exception_ptr ep) {
            if (!ep) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("Receive session {} ended abnormally: {}", session->task_id(), e.what());
            }
        });
    }
    spdlog::debug("Transfer server accept loop finished.");
}

std::shared_ptr<ReceiveSession> TransferServer::findSession(std::string_view task_id) const {
    for (const auto& session : sessions_) {
        if (session->task_id() == task_id) {
            return session;
        }
    }
    return nullptr;
}

void TransferServer::removeSession(const std::string& task_id) {
    sessions_.remove_if([&task_id](const std::shared_ptr<ReceiveSession>& session) {
        return session->task_id() == task_id && IsTerminal(session->state());
    });
}

} // namespace landrop::core

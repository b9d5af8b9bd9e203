#include <core/model/feedback.h>
#include <core/transfer/file_collector.h>
#include <core/util/system.h>
#include <service/backend_service.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace landrop::service {

namespace {

core::DiscoveryOptions MakeDiscoveryOptions(const core::Settings& settings) {
    core::DiscoveryOptions options;
    options.port = settings.discovery_port;
    options.announce_interval = std::chrono::milliseconds(settings.announce_interval_ms);
    options.sweep_interval = std::chrono::milliseconds(settings.sweep_interval_ms);
    return options;
}

core::ReceiveOptions MakeReceiveOptions(const core::Settings& settings) {
    return core::ReceiveOptions{
        .save_dir = settings.save_dir,
        .auto_accept = settings.auto_receive,
        .confirm_timeout = std::chrono::seconds(settings.confirm_timeout_s),
    };
}

} // namespace

BackendService::BackendService(boost::asio::io_context& ioc,
                               EventStream& event_stream,
                               core::Settings& settings)
    : ioc_(ioc)
    , event_stream_(event_stream)
    , settings_(settings)
    , registry_(std::chrono::milliseconds(settings.staleness_window_ms))
    , discovery_manager_(ioc, registry_, localDevice(), MakeDiscoveryOptions(settings))
    , transfer_server_(ioc,
                       gate_,
                       MakeReceiveOptions(settings),
                       [this](core::Feedback&& feedback) { this->feedback(std::move(feedback)); })
    , transfer_client_(ioc,
                       gate_,
                       localDevice(),
                       [this](core::Feedback&& feedback) { this->feedback(std::move(feedback)); }) {
    discovery_manager_.SetDeviceFoundCallback([this](const core::DeviceInfo& device) {
        feedback(core::Feedback{
            .type = core::FeedbackType::kFoundDevice,
            .data = core::feedback::FoundDevice{.device_info = device},
        });
    });
    discovery_manager_.SetDeviceLostCallback([this](const core::DeviceInfo& device) {
        feedback(core::Feedback{
            .type = core::FeedbackType::kLostDevice,
            .data = core::feedback::LostDevice{.device_info = device},
        });
    });
    discovery_manager_.SetFailureCallback([this](const std::string& message) {
        feedback(core::Feedback{
            .type = core::FeedbackType::kDiscoveryFailed,
            .data = core::feedback::DiscoveryFailed{.error_message = message},
        });
    });
}

BackendService::~BackendService() {
    Stop();
}

void BackendService::Start() {
    if (is_running_) {
        return;
    }

    std::error_code ec;
    fs::create_directories(settings_.save_dir, ec);
    if (ec) {
        spdlog::warn("Cannot create save directory {}: {}", settings_.save_dir.string(), ec.message());
    }

    transfer_server_.Start(settings_.transfer_port);
    discovery_manager_.SetTransferPort(transfer_server_.port());
    try {
        discovery_manager_.Start();
    } catch (const boost::system::system_error& e) {
        feedback(core::Feedback{
            .type = core::FeedbackType::kDiscoveryFailed,
            .data = core::feedback::DiscoveryFailed{.error_message = e.what()},
        });
    }

    is_running_ = true;
    postSettings();
    spdlog::debug("BackendService started");
}

void BackendService::Stop() {
    if (!is_running_) {
        return;
    }
    is_running_ = false;
    discovery_manager_.Stop();
    transfer_client_.CancelAll();
    transfer_server_.Stop();
    spdlog::debug("BackendService stopped");
}

void BackendService::RefreshDevices() {
    discovery_manager_.Announce();
}

std::vector<core::FileEntry> BackendService::CollectEntries(const std::vector<fs::path>& paths) const {
    return core::CollectEntries(paths);
}

std::string BackendService::SendFiles(std::string_view device_id,
                                      std::vector<core::FileEntry> entries) {
    auto device = registry_.Get(device_id);
    if (!device || !device->online) {
        spdlog::error("Device not found: {}", device_id);
        return {};
    }
    if (entries.empty()) {
        spdlog::error("No files to send");
        return {};
    }
    return transfer_client_.SendFiles(*device, std::move(entries));
}

bool BackendService::RespondToRequest(std::string_view task_id, bool accepted, std::string reason) {
    return transfer_server_.Respond(task_id, accepted, std::move(reason));
}

bool BackendService::CancelTransfer(std::string_view task_id) {
    if (transfer_client_.GetTask(task_id)) {
        return transfer_client_.Cancel(task_id);
    }
    return transfer_server_.Cancel(task_id);
}

bool BackendService::SetSaveDir(const fs::path& save_dir) {
    std::error_code ec;
    if (!fs::is_directory(save_dir, ec)) {
        spdlog::error("Save directory {} does not exist", save_dir.string());
        return false;
    }
    settings_.save_dir = fs::absolute(save_dir, ec);
    transfer_server_.SetSaveDirectory(settings_.save_dir);
    postSettings();
    return true;
}

void BackendService::SetAutoReceive(bool auto_receive) {
    settings_.auto_receive = auto_receive;
    transfer_server_.SetAutoAccept(auto_receive);
    postSettings();
}

core::DeviceInfo BackendService::localDevice() const {
    core::DeviceInfo local;
    local.device_id = settings_.device_id;
    local.device_name = settings_.device_name;
    local.platform = core::system::PlatformTag();
    local.device_type = core::ClassifyPlatform(local.platform);
    local.port = settings_.transfer_port;
    return local;
}

void BackendService::postSettings() {
    feedback(core::Feedback{
        .type = core::FeedbackType::kSettings,
        .data = core::feedback::Settings::FromConfigSettings(settings_),
    });
}

} // namespace landrop::service

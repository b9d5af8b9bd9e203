#pragma once

#include <nlohmann/json.hpp>

namespace landrop::core {

enum class FeedbackType {
    kSettings,        // 设置内容，程序启动时通知ui去显示
    kFoundDevice,     // 发现了新的设备 （设备完整信息）
    kLostDevice,      // 失去了一个设备（设备下线）
    kDiscoveryFailed, // 发现服务的套接字出错, discovery is not restarted automatically

    kTransferRequested, // 接收到了新的传输请求（完整的TransferTask）
    kTransferAccepted,  // 对方同意接收文件
    kTransferRejected,  // 对方拒绝接收文件（包含原因）
    kTransferProgress,  // 传输进度（已传输字节数，总字节数，速度）
    kTransferCompleted, // 传输完成（最终的TransferTask，交给历史记录）
    kTransferError,     // 传输失败或被取消（错误类别，最终状态，原因）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kSettings, "Settings"},
                                 {FeedbackType::kFoundDevice, "FoundDevice"},
                                 {FeedbackType::kLostDevice, "LostDevice"},
                                 {FeedbackType::kDiscoveryFailed, "DiscoveryFailed"},
                                 {FeedbackType::kTransferRequested, "TransferRequested"},
                                 {FeedbackType::kTransferAccepted, "TransferAccepted"},
                                 {FeedbackType::kTransferRejected, "TransferRejected"},
                                 {FeedbackType::kTransferProgress, "TransferProgress"},
                                 {FeedbackType::kTransferCompleted, "TransferCompleted"},
                                 {FeedbackType::kTransferError, "TransferError"},
                             });

} // namespace landrop::core

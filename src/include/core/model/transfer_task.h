#pragma once

#include "file_entry.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace landrop::core {

enum class TransferStatus {
    kPending,
    kAwaitingAcceptance,
    kTransferring,
    kCompleted,
    kFailed,
    kCancelled,
    kRejected,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferStatus,
                             {
                                 {TransferStatus::kPending, "pending"},
                                 {TransferStatus::kAwaitingAcceptance, "awaiting-acceptance"},
                                 {TransferStatus::kTransferring, "transferring"},
                                 {TransferStatus::kCompleted, "completed"},
                                 {TransferStatus::kFailed, "failed"},
                                 {TransferStatus::kCancelled, "cancelled"},
                                 {TransferStatus::kRejected, "rejected"},
                             });

enum class TransferDirection {
    kOutbound,
    kInbound,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferDirection,
                             {
                                 {TransferDirection::kOutbound, "send"},
                                 {TransferDirection::kInbound, "receive"},
                             });

struct TransferTask {
    std::string task_id;
    std::string device_id;   // peer device
    std::string device_name;
    std::string peer_address;
    std::vector<FileEntry> files;
    std::uint64_t total_size = 0;
    std::uint64_t transferred_size = 0;
    TransferStatus status = TransferStatus::kPending;
    double throughput = 0.0; // bytes per second
    TransferDirection direction = TransferDirection::kOutbound;
    std::int64_t start_time = 0; // milliseconds since epoch

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferTask,
                                   task_id,
                                   device_id,
                                   device_name,
                                   peer_address,
                                   files,
                                   total_size,
                                   transferred_size,
                                   status,
                                   throughput,
                                   direction,
                                   start_time)
};

} // namespace landrop::core

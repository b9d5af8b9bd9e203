#pragma once

#include "core/model/transfer_task.h"
#include "core/transfer/transfer_error.h"
#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct TransferError {
    std::string task_id;
    ErrorKind kind = ErrorKind::kTransport;
    TransferStatus status = TransferStatus::kFailed; // kFailed or kCancelled
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferError, task_id, kind, status, error_message);
};

} // namespace landrop::core::feedback

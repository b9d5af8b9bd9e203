#pragma once

#include "core/model/transfer_task.h"

namespace landrop::core::feedback {

struct TransferCompleted {
    TransferTask task;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferCompleted, task);
};

} // namespace landrop::core::feedback

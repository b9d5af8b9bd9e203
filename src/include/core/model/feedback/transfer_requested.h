#pragma once

#include "core/model/transfer_task.h"

namespace landrop::core::feedback {

struct TransferRequested {
    TransferTask task;
    bool auto_accepted = false;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferRequested, task, auto_accepted);
};

} // namespace landrop::core::feedback

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct TransferRejected {
    std::string task_id;
    std::string device_id;
    std::string reason;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferRejected, task_id, device_id, reason);
};

} // namespace landrop::core::feedback

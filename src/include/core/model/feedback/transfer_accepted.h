#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct TransferAccepted {
    std::string task_id;
    std::string device_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferAccepted, task_id, device_id);
};

} // namespace landrop::core::feedback

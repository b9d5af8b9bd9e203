#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct TransferProgress {
    std::string task_id;
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    double throughput = 0.0; // bytes per second
    double progress = 0.0;   // 0.0 ~ 1.0, exactly 1.0 only once every file is finished

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferProgress, task_id, transferred, total, throughput, progress);
};

} // namespace landrop::core::feedback

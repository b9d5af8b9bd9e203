#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace landrop::core::feedback {

struct DiscoveryFailed {
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DiscoveryFailed, error_message);
};

} // namespace landrop::core::feedback

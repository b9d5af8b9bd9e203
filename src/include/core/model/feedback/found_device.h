#pragma once

#include "core/model/device_info.h"

namespace landrop::core::feedback {

struct FoundDevice {
    DeviceInfo device_info;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FoundDevice, device_info);
};

} // namespace landrop::core::feedback

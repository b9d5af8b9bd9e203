#pragma once

#include "core/model/device_info.h"

namespace landrop::core::feedback {

struct LostDevice {
    DeviceInfo device_info;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LostDevice, device_info);
};

} // namespace landrop::core::feedback

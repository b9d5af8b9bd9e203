#pragma once

#include "feedback/discovery_failed.h"
#include "feedback/feedback_type.h"
#include "feedback/found_device.h"
#include "feedback/lost_device.h"
#include "feedback/settings.h"
#include "feedback/transfer_accepted.h"
#include "feedback/transfer_completed.h"
#include "feedback/transfer_error.h"
#include "feedback/transfer_progress.h"
#include "feedback/transfer_rejected.h"
#include "feedback/transfer_requested.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace landrop::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace landrop::core

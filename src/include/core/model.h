#pragma once

#include "model/device_info.h"
#include "model/dto/announce_dto.h"
#include "model/dto/transfer_ack_dto.h"
#include "model/dto/transfer_request_dto.h"
#include "model/dto/transfer_response_dto.h"
#include "model/feedback.h"
#include "model/file_entry.h"
#include "model/session_state.h"
#include "model/transfer_task.h"

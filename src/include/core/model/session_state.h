#pragma once

#include <nlohmann/json.hpp>

namespace landrop::core {

enum class SessionState {
    kIdle,            // 空闲状态
    kRequestSent,     // 已发送请求, 等待接收方确认 (initiator)
    kRequestReceived, // 已收到请求, 等待用户确认 (responder)
    kAccepted,        // 接收方同意
    kStreaming,       // 传输中
    kFinishing,       // 结束标记已发送/已收到
    kCompleted,       // 传输完成
    kRejected,        // 接收方拒绝
    kFailed,          // 传输失败
    kCancelled,       // 本地用户取消
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionState,
                             {
                                 {SessionState::kIdle, "Idle"},
                                 {SessionState::kRequestSent, "RequestSent"},
                                 {SessionState::kRequestReceived, "RequestReceived"},
                                 {SessionState::kAccepted, "Accepted"},
                                 {SessionState::kStreaming, "Streaming"},
                                 {SessionState::kFinishing, "Finishing"},
                                 {SessionState::kCompleted, "Completed"},
                                 {SessionState::kRejected, "Rejected"},
                                 {SessionState::kFailed, "Failed"},
                                 {SessionState::kCancelled, "Cancelled"},
                             });

inline bool IsTerminal(SessionState state) {
    return state == SessionState::kCompleted || state == SessionState::kRejected
           || state == SessionState::kFailed || state == SessionState::kCancelled;
}

} // namespace landrop::core

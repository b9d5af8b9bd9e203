#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace landrop::core {

// Sent by the responder after the end-of-transfer sentinel, right before it closes
struct TransferAckDto {
    static constexpr const char* kKind = "transfer_ack";

    bool success = true;
    std::optional<std::string> reason;
};

inline void to_json(nlohmann::json& j, const TransferAckDto& dto) {
    j = nlohmann::json{{"kind", TransferAckDto::kKind}, {"success", dto.success}};
    if (dto.reason) {
        j["reason"] = *dto.reason;
    }
}

inline void from_json(const nlohmann::json& j, TransferAckDto& dto) {
    if (j.at("kind").get<std::string>() != TransferAckDto::kKind) {
        throw std::invalid_argument("not a transfer_ack record");
    }
    j.at("success").get_to(dto.success);
    if (auto it = j.find("reason"); it != j.end() && it->is_string()) {
        dto.reason = it->get<std::string>();
    }
}

} // namespace landrop::core

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace landrop::core {

struct TransferResponseDto {
    static constexpr const char* kKind = "transfer_response";

    bool accepted = false;
    std::optional<std::string> reason;
};

inline void to_json(nlohmann::json& j, const TransferResponseDto& dto) {
    j = nlohmann::json{{"kind", TransferResponseDto::kKind}, {"accepted", dto.accepted}};
    if (dto.reason) {
        j["reason"] = *dto.reason;
    }
}

inline void from_json(const nlohmann::json& j, TransferResponseDto& dto) {
    if (j.at("kind").get<std::string>() != TransferResponseDto::kKind) {
        throw std::invalid_argument("not a transfer_response record");
    }
    j.at("accepted").get_to(dto.accepted);
    if (auto it = j.find("reason"); it != j.end() && it->is_string()) {
        dto.reason = it->get<std::string>();
    }
}

} // namespace landrop::core

#pragma once

#include "../file_entry.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace landrop::core {

struct TransferRequestDto {
    static constexpr const char* kKind = "transfer_request";

    std::optional<std::string> task_id;
    std::optional<std::string> sender_id;
    std::optional<std::string> sender_name;
    std::uint64_t total_size = 0;
    std::vector<FileEntry> files;
};

inline void to_json(nlohmann::json& j, const TransferRequestDto& dto) {
    j = nlohmann::json{
        {"kind", TransferRequestDto::kKind},
        {"totalSize", dto.total_size},
        {"files", dto.files},
    };
    if (dto.task_id) {
        j["taskId"] = *dto.task_id;
    }
    if (dto.sender_id || dto.sender_name) {
        j["sender"] = {{"deviceId", dto.sender_id.value_or("")},
                       {"deviceName", dto.sender_name.value_or("")}};
    }
}

inline void from_json(const nlohmann::json& j, TransferRequestDto& dto) {
    if (j.at("kind").get<std::string>() != TransferRequestDto::kKind) {
        throw std::invalid_argument("not a transfer_request record");
    }
    j.at("totalSize").get_to(dto.total_size);
    j.at("files").get_to(dto.files);
    if (auto it = j.find("taskId"); it != j.end() && it->is_string()) {
        dto.task_id = it->get<std::string>();
    }
    if (auto it = j.find("sender"); it != j.end() && it->is_object()) {
        dto.sender_id = it->value("deviceId", "");
        dto.sender_name = it->value("deviceName", "");
    }
}

} // namespace landrop::core

#include <core/model/file_entry.h>
#include <numeric>
#include <stdexcept>

namespace landrop::core {

std::uint64_t TotalSize(const std::vector<FileEntry>& entries) {
    return std::accumulate(entries.begin(),
                           entries.end(),
                           std::uint64_t{0},
                           [](std::uint64_t sum, const FileEntry& entry) {
                               return entry.is_directory ? sum : sum + entry.size;
                           });
}

void to_json(nlohmann::json& j, const FileEntry& entry) {
    j = nlohmann::json{
        {"name", entry.name},
        {"size", entry.is_directory ? 0 : entry.size},
        {"isDirectory", entry.is_directory},
    };
    if (entry.relative_path) {
        j["relativePath"] = *entry.relative_path;
    }
}

void from_json(const nlohmann::json& j, FileEntry& entry) {
    j.at("name").get_to(entry.name);
    const auto& size = j.at("size");
    if (!size.is_number_unsigned()) {
        throw std::invalid_argument("file size must be a non-negative integer");
    }
    size.get_to(entry.size);
    j.at("isDirectory").get_to(entry.is_directory);
    if (auto it = j.find("relativePath"); it != j.end() && it->is_string()) {
        entry.relative_path = it->get<std::string>();
    } else {
        entry.relative_path.reset();
    }
    entry.source_path.clear();
}

} // namespace landrop::core

#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace landrop::core {

struct FileEntry {
    std::string name;
    std::uint64_t size = 0; // exact byte count streamed; meaningless for directories
    bool is_directory = false;
    std::filesystem::path source_path; // sender-local only, never transmitted
    std::optional<std::string> relative_path;

    // Path of the entry below the destination root: relative_path, or name when absent
    std::string DestinationPath() const { return relative_path.value_or(name); }
};

// Sum of the declared sizes of all non-directory entries
std::uint64_t TotalSize(const std::vector<FileEntry>& entries);

// Wire form: {name, size, isDirectory, relativePath?}
void to_json(nlohmann::json& j, const FileEntry& entry);
void from_json(const nlohmann::json& j, FileEntry& entry);

} // namespace landrop::core

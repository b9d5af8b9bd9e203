#include <algorithm>
#include <core/transfer/file_collector.h>
#include <core/transfer/transfer_error.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace landrop::core {

namespace {

FileEntry MakeFileEntry(const fs::path& path, std::optional<std::string> relative_path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw FilesystemError(fmt::format("cannot stat {}: {}", path.string(), ec.message()));
    }
    FileEntry entry;
    entry.name = path.filename().string();
    entry.size = size;
    entry.source_path = path;
    entry.relative_path = std::move(relative_path);
    return entry;
}

void CollectDirectory(const fs::path& directory,
                      const fs::path& relative,
                      std::vector<FileEntry>& entries) {
    FileEntry dir_entry;
    dir_entry.name = directory.filename().string();
    dir_entry.is_directory = true;
    dir_entry.source_path = directory;
    dir_entry.relative_path = relative.generic_string();
    entries.push_back(std::move(dir_entry));

    std::error_code ec;
    std::vector<fs::directory_entry> children;
    for (const auto& child : fs::directory_iterator(directory, ec)) {
        children.push_back(child);
    }
    if (ec) {
        throw FilesystemError(
            fmt::format("cannot list directory {}: {}", directory.string(), ec.message()));
    }
    std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) {
        return a.path().filename() < b.path().filename();
    });

    for (const auto& child : children) {
        auto child_relative = relative / child.path().filename();
        if (child.is_directory(ec)) {
            CollectDirectory(child.path(), child_relative, entries);
        } else if (child.is_regular_file(ec)) {
            entries.push_back(MakeFileEntry(child.path(), child_relative.generic_string()));
        } else {
            spdlog::debug("Skipping {}: not a regular file", child.path().string());
        }
    }
}

} // namespace

std::vector<FileEntry> CollectEntries(const std::vector<fs::path>& paths) {
    std::vector<FileEntry> entries;
    for (const auto& picked : paths) {
        std::error_code ec;
        auto path = fs::absolute(picked, ec);
        if (ec || !fs::exists(path, ec)) {
            spdlog::error("File not found: {}", picked.string());
            continue;
        }
        // "dir/" has an empty filename, drop the trailing separator
        if (!path.has_filename()) {
            path = path.parent_path();
        }
        if (fs::is_directory(path, ec)) {
            CollectDirectory(path, path.filename(), entries);
        } else {
            entries.push_back(MakeFileEntry(path, std::nullopt));
        }
    }
    spdlog::debug("Collected {} entries ({} bytes)", entries.size(), TotalSize(entries));
    return entries;
}

} // namespace landrop::core

#include <core/transfer/file_source.h>
#include <core/transfer/transfer_error.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace landrop::core {

FileSource::FileSource(std::vector<FileEntry> entries, std::size_t chunk_size)
    : entries_(std::move(entries))
    , chunk_size_(chunk_size) {}

std::size_t FileSource::Next(BinaryData& buffer) {
    while (remaining_ == 0) {
        if (in_.is_open()) {
            in_.close();
        }
        if (!openNext()) {
            buffer.clear();
            return 0;
        }
    }

    auto count = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, chunk_size_));
    buffer.resize(count);
    in_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(in_.gcount()) != count) {
        const auto& entry = entries_[index_ - 1];
        throw FilesystemError(fmt::format("{} is shorter than its declared {} bytes",
                                          entry.source_path.string(),
                                          entry.size));
    }
    remaining_ -= count;
    produced_ += count;
    return count;
}

void FileSource::Close() {
    if (in_.is_open()) {
        in_.close();
    }
}

bool FileSource::openNext() {
    while (index_ < entries_.size()) {
        const auto& entry = entries_[index_++];
        if (entry.is_directory || entry.size == 0) {
            continue;
        }
        in_.open(entry.source_path, std::ios::binary);
        if (!in_.is_open()) {
            throw FilesystemError(
                fmt::format("cannot open {} for reading", entry.source_path.string()));
        }
        spdlog::debug("Sending {} ({} bytes)", entry.source_path.string(), entry.size);
        remaining_ = entry.size;
        return true;
    }
    return false;
}

} // namespace landrop::core

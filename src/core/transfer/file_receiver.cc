#include <core/transfer/file_receiver.h>
#include <core/transfer/path_guard.h>
#include <core/transfer/transfer_error.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace landrop::core {

FileReceiver::FileReceiver(fs::path root, std::vector<FileEntry> manifest)
    : root_(std::move(root)) {
    targets_.reserve(manifest.size());
    for (auto& entry : manifest) {
        auto path = ResolveUnderRoot(root_, entry.DestinationPath());
        targets_.push_back(Target{std::move(entry), std::move(path)});
    }
}

FileReceiver::~FileReceiver() {
    Close();
}

void FileReceiver::Open() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw FilesystemError(
            fmt::format("cannot create destination root {}: {}", root_.string(), ec.message()));
    }
    advance();
}

void FileReceiver::Write(const std::uint8_t* data, std::size_t size) {
    while (size > 0) {
        if (done()) {
            throw ProtocolError(
                fmt::format("received {} bytes beyond the declared total size", size));
        }
        if (!out_.is_open()) {
            openCurrent();
        }

        auto count = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, size));
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(count));
        if (!out_) {
            throw FilesystemError(
                fmt::format("failed to write {}", targets_[index_].path.string()));
        }
        data += count;
        size -= count;
        remaining_ -= count;
        written_ += count;

        if (remaining_ == 0) {
            closeCurrent();
            ++completed_files_;
            ++index_;
            advance();
        }
    }
}

void FileReceiver::Finish() {
    if (!done()) {
        const auto& target = targets_[index_];
        throw ProtocolError(fmt::format("end of transfer with {} bytes missing for {}",
                                        remaining_,
                                        target.entry.DestinationPath()));
    }
    Close();
}

void FileReceiver::Close() {
    if (out_.is_open()) {
        out_.close();
    }
}

void FileReceiver::advance() {
    while (index_ < targets_.size()) {
        const auto& target = targets_[index_];
        if (target.entry.is_directory) {
            std::error_code ec;
            fs::create_directories(target.path, ec);
            if (ec) {
                throw FilesystemError(fmt::format("cannot create directory {}: {}",
                                                  target.path.string(),
                                                  ec.message()));
            }
            spdlog::debug("Created directory {}", target.path.string());
            ++index_;
            continue;
        }
        remaining_ = target.entry.size;
        if (remaining_ > 0) {
            return;
        }
        // Empty files carry no frames but must still exist
        openCurrent();
        closeCurrent();
        ++completed_files_;
        ++index_;
    }
}

void FileReceiver::openCurrent() {
    const auto& target = targets_[index_];
    std::error_code ec;
    fs::create_directories(target.path.parent_path(), ec);
    if (ec) {
        throw FilesystemError(fmt::format("cannot create directory {}: {}",
                                          target.path.parent_path().string(),
                                          ec.message()));
    }
    out_.open(target.path, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_.is_open()) {
        throw FilesystemError(fmt::format("cannot open {} for writing", target.path.string()));
    }
    spdlog::debug("Receiving {} ({} bytes)", target.path.string(), target.entry.size);
}

void FileReceiver::closeCurrent() {
    out_.close();
    if (out_.fail()) {
        out_.clear();
        throw FilesystemError(fmt::format("failed to close {}", targets_[index_].path.string()));
    }
    spdlog::debug("Finished {}", targets_[index_].path.string());
}

} // namespace landrop::core

#pragma once

#include <core/model/file_entry.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace landrop::core {

// Materializes a manifest below a destination root from a flat byte stream.
// Entries are consumed in manifest order: directories are created when reached, files are
// opened when reached and closed once their declared size has been written. Byte boundaries of
// Write() calls are irrelevant, one call may finish a file and start the next one.
class FileReceiver {
public:
    // Resolves every entry under root up front; throws TransferError(kProtocol) on a path that
    // would escape root, before anything is created or opened.
    FileReceiver(std::filesystem::path root, std::vector<FileEntry> manifest);
    ~FileReceiver();

    FileReceiver(const FileReceiver&) = delete;
    FileReceiver& operator=(const FileReceiver&) = delete;

    // Creates the destination root and every entry that needs no data ahead of the first file.
    void Open();

    // Throws TransferError(kProtocol) when data goes past the declared total and
    // TransferError(kFilesystem) on I/O failure.
    void Write(const std::uint8_t* data, std::size_t size);

    // Called on the end-of-transfer sentinel. Throws TransferError(kProtocol) if declared bytes
    // are still missing.
    void Finish();

    // Releases the open handle, if any. Bytes already written stay on disk.
    void Close();

    bool done() const { return index_ >= targets_.size(); }
    std::uint64_t written() const { return written_; }
    std::size_t completed_files() const { return completed_files_; }
    const std::filesystem::path& root() const { return root_; }

private:
    struct Target {
        FileEntry entry;
        std::filesystem::path path;
    };

    void advance(); // skips over entries that need no data, creating them
    void openCurrent();
    void closeCurrent();

    std::filesystem::path root_;
    std::vector<Target> targets_;
    std::size_t index_{0};
    std::uint64_t remaining_{0}; // bytes left for targets_[index_]
    std::uint64_t written_{0};
    std::size_t completed_files_{0};
    std::ofstream out_;
};

} // namespace landrop::core

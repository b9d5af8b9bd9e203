#pragma once

#include <core/constant/transfer.h>
#include <core/model/file_entry.h>
#include <core/util/wire_format.h>
#include <cstdint>
#include <fstream>
#include <vector>

namespace landrop::core {

// Reads the bytes of a manifest's file entries in order, in chunks of at most chunk_size.
// Exactly the declared size of each file is produced: a file that grew is truncated to it and a
// file that shrank is a filesystem error.
class FileSource {
public:
    explicit FileSource(std::vector<FileEntry> entries,
                        std::size_t chunk_size = transfer::kChunkSize);

    // Fills buffer with the next chunk and returns its size, 0 once every file is exhausted.
    // Throws TransferError(kFilesystem).
    std::size_t Next(BinaryData& buffer);

    void Close();

    std::uint64_t produced() const { return produced_; }

private:
    bool openNext();

    std::vector<FileEntry> entries_;
    std::size_t chunk_size_;
    std::size_t index_{0};
    std::uint64_t remaining_{0};
    std::uint64_t produced_{0};
    std::ifstream in_;
};

} // namespace landrop::core

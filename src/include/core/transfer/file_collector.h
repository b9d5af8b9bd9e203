#pragma once

#include <core/model/file_entry.h>
#include <filesystem>
#include <vector>

namespace landrop::core {

// Turns picked paths into a manifest. A picked file becomes one entry; a picked directory becomes
// a directory entry followed by its contents in pre-order, every relative path starting with the
// picked directory's own name. Paths that do not exist are logged and skipped.
std::vector<FileEntry> CollectEntries(const std::vector<std::filesystem::path>& paths);

} // namespace landrop::core

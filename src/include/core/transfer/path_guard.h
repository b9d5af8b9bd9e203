#pragma once

#include <filesystem>
#include <string_view>

namespace landrop::core {

// Joins a manifest path below the destination root.
// Throws TransferError(kProtocol) for empty, absolute or rooted paths and for any ".." segment,
// so the result never escapes root. Both '/' and '\\' are accepted as separators.
std::filesystem::path ResolveUnderRoot(const std::filesystem::path& root,
                                       std::string_view relative_path);

} // namespace landrop::core

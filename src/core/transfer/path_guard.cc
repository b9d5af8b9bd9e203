#include <algorithm>
#include <core/transfer/path_guard.h>
#include <core/transfer/transfer_error.h>
#include <fmt/format.h>
#include <string>

namespace fs = std::filesystem;

namespace landrop::core {

fs::path ResolveUnderRoot(const fs::path& root, std::string_view relative_path) {
    std::string normalized(relative_path);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    if (normalized.empty()) {
        throw ProtocolError("empty path in manifest");
    }
    if (normalized.find('\0') != std::string::npos) {
        throw ProtocolError("path contains a NUL byte");
    }

    fs::path candidate(normalized);
    if (candidate.is_absolute() || candidate.has_root_name() || candidate.has_root_directory()
        || normalized.front() == '/') {
        throw ProtocolError(fmt::format("absolute path rejected: {}", relative_path));
    }

    fs::path clean;
    for (const auto& segment : candidate) {
        if (segment == "..") {
            throw ProtocolError(fmt::format("path escapes destination root: {}", relative_path));
        }
        if (segment.empty() || segment == ".") {
            continue;
        }
        clean /= segment;
    }
    if (clean.empty()) {
        throw ProtocolError(fmt::format("path names no entry: {}", relative_path));
    }
    return root / clean;
}

} // namespace landrop::core

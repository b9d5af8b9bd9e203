#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace landrop::core {

enum class ErrorKind {
    kTransport,  // socket/connection failure, bind failure
    kProtocol,   // malformed control record, size mismatch, path traversal
    kFilesystem, // cannot create destination path, read/write failure
    kCancelled,  // deliberate user cancellation, reported through the same channel
};

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind,
                             {
                                 {ErrorKind::kTransport, "transport"},
                                 {ErrorKind::kProtocol, "protocol"},
                                 {ErrorKind::kFilesystem, "filesystem"},
                                 {ErrorKind::kCancelled, "cancelled"},
                             });

const char* ErrorKindToString(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

inline TransferError ProtocolError(const std::string& message) {
    return TransferError(ErrorKind::kProtocol, message);
}

inline TransferError FilesystemError(const std::string& message) {
    return TransferError(ErrorKind::kFilesystem, message);
}

} // namespace landrop::core

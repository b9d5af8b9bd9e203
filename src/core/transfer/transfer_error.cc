#include <core/transfer/transfer_error.h>

namespace landrop::core {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kTransport:
        return "transport";
    case ErrorKind::kProtocol:
        return "protocol";
    case ErrorKind::kFilesystem:
        return "filesystem";
    case ErrorKind::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace landrop::core

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace landrop::core {

using BinaryData = std::vector<std::uint8_t>;

namespace details {

struct FrameHeader {
    std::uint32_t length; // network byte order on the wire
};

} // namespace details

constexpr std::size_t kFrameHeaderSize = sizeof(details::FrameHeader);

// A zero-length frame is the end-of-transfer sentinel
constexpr std::uint32_t kEndOfTransfer = 0;

inline std::array<std::uint8_t, kFrameHeaderSize> EncodeFrameHeader(std::uint32_t length) {
    details::FrameHeader header;
    header.length = htonl(length);

    std::array<std::uint8_t, kFrameHeaderSize> bytes;
    std::memcpy(bytes.data(), &header, sizeof(header));
    return bytes;
}

inline std::uint32_t DecodeFrameHeader(const std::uint8_t* bytes) {
    details::FrameHeader header;
    std::memcpy(&header, bytes, sizeof(header));
    return ntohl(header.length);
}

// Control records are single-line JSON documents terminated by '\n'
inline std::string EncodeRecord(const nlohmann::json& record) {
    return record.dump() + '\n';
}

inline std::optional<nlohmann::json> ParseRecord(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    try {
        auto record = nlohmann::json::parse(line);
        if (!record.is_object()) {
            return std::nullopt;
        }
        return record;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Failed to parse control record: {}", e.what());
        return std::nullopt;
    }
}

} // namespace landrop::core

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace landrop::core {

namespace transfer {

constexpr std::uint16_t kDefaultTransferPort = 5201;

constexpr std::size_t kChunkSize = 64 * 1024;            // 64 KiB
constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;  // 16 MiB, larger frames are rejected
constexpr std::size_t kMaxControlRecordSize = 1024 * 1024;

// Throughput is recomputed at most this often
constexpr auto kProgressSampleInterval = std::chrono::milliseconds(500);

constexpr auto kDefaultConfirmTimeout = std::chrono::seconds(30);

} // namespace transfer

namespace discovery {

constexpr std::uint16_t kDefaultDiscoveryPort = 5200;
constexpr const char* kBroadcastAddress = "255.255.255.255";

constexpr auto kAnnounceInterval = std::chrono::milliseconds(3000);
constexpr auto kStalenessWindow = std::chrono::milliseconds(10000);
constexpr auto kSweepInterval = std::chrono::milliseconds(1000);
// Lower bound for configured announce and sweep intervals
constexpr auto kMinTimerInterval = std::chrono::milliseconds(100);

constexpr std::size_t kMaxDatagramSize = 2048;

} // namespace discovery

} // namespace landrop::core

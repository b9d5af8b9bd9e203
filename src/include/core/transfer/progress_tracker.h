#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstdint>

namespace landrop::core {

// Byte accounting and throughput sampling for one transfer.
// Throughput is recomputed at most once per sample interval from the bytes moved since the
// previous sample, so a zero-length interval never divides. fraction() reaches exactly 1.0 only
// once the tracker is finished, which happens the moment the declared total has been applied
// (or on Finish() for transfers that carry no bytes).
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::uint64_t total = 0,
                             Clock::duration sample_interval = transfer::kProgressSampleInterval);

    void Start(Clock::time_point now = Clock::now());

    // Returns true when a progress notification is due: a new throughput sample was taken, or
    // these bytes finished the transfer.
    bool Add(std::uint64_t bytes, Clock::time_point now = Clock::now());

    // Marks the transfer finished; returns false if it already was.
    bool Finish(Clock::time_point now = Clock::now());

    std::uint64_t total() const { return total_; }
    std::uint64_t transferred() const { return transferred_; }
    double throughput() const { return throughput_; }
    bool finished() const { return finished_; }
    double fraction() const;

private:
    void sample(Clock::time_point now);

    std::uint64_t total_;
    std::uint64_t transferred_{0};
    Clock::duration sample_interval_;
    Clock::time_point last_sample_time_{};
    std::uint64_t last_sample_bytes_{0};
    double throughput_{0.0};
    bool finished_{false};
};

} // namespace landrop::core

#include <algorithm>
#include <cmath>
#include <core/transfer/progress_tracker.h>

namespace landrop::core {

ProgressTracker::ProgressTracker(std::uint64_t total, Clock::duration sample_interval)
    : total_(total)
    , sample_interval_(sample_interval) {}

void ProgressTracker::Start(Clock::time_point now) {
    last_sample_time_ = now;
    last_sample_bytes_ = transferred_;
}

bool ProgressTracker::Add(std::uint64_t bytes, Clock::time_point now) {
    transferred_ += bytes;

    bool just_finished = false;
    if (!finished_ && transferred_ >= total_ && total_ > 0) {
        finished_ = true;
        just_finished = true;
    }

    bool sampled = false;
    if (now - last_sample_time_ >= sample_interval_) {
        sample(now);
        sampled = true;
    } else if (just_finished && now > last_sample_time_) {
        sample(now);
    }
    return sampled || just_finished;
}

bool ProgressTracker::Finish(Clock::time_point now) {
    if (finished_) {
        return false;
    }
    finished_ = true;
    if (now > last_sample_time_) {
        sample(now);
    }
    return true;
}

double ProgressTracker::fraction() const {
    if (finished_) {
        return 1.0;
    }
    if (total_ == 0) {
        return 0.0;
    }
    // Never report 100% before every byte is accounted for, whatever the rounding
    const double ratio = static_cast<double>(transferred_) / static_cast<double>(total_);
    return std::min(ratio, std::nextafter(1.0, 0.0));
}

void ProgressTracker::sample(Clock::time_point now) {
    const auto elapsed = std::chrono::duration<double>(now - last_sample_time_).count();
    if (elapsed > 0.0) {
        throughput_ = static_cast<double>(transferred_ - last_sample_bytes_) / elapsed;
    }
    last_sample_time_ = now;
    last_sample_bytes_ = transferred_;
}

} // namespace landrop::core

#pragma once

#include <chrono>
#include <core/model/device_info.h>
#include <core/model/dto/announce_dto.h>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace landrop::core {

// In-memory table of known peers keyed by device id. No I/O, no timers: the owner feeds it
// announcements and sweeps it with the current time.
class DeviceRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit DeviceRegistry(Clock::duration staleness_window);

    // Records or refreshes a device from an already validated announcement. Address is always the
    // transport-observed source. Returns true on first sighting or when an offline device returns.
    bool Upsert(const AnnounceDto& announce,
                std::string_view source_address,
                Clock::time_point now = Clock::now());

    // Marks every online device silent for longer than the staleness window offline and returns
    // those devices. A device goes offline at most once per sighting.
    std::vector<DeviceInfo> Sweep(Clock::time_point now = Clock::now());

    // Online devices only
    std::vector<DeviceInfo> List() const;

    std::optional<DeviceInfo> Get(std::string_view device_id) const;

    std::size_t size() const { return devices_.size(); }
    Clock::duration staleness_window() const { return staleness_window_; }

private:
    Clock::duration staleness_window_;
    std::unordered_map<std::string, DeviceInfo> devices_;
};

} // namespace landrop::core

#pragma once

#include <string>
#include <string_view>

namespace landrop::core {

// Admits at most one active transfer per process. Shared by the server and the client so an
// inbound and an outbound transfer never write or stream at the same time.
class TransferGate {
public:
    // Not re-entrant: an inbound task id is peer-chosen, so a second session under the same id is
    // refused like any other
    bool TryAcquire(std::string_view task_id) {
        if (!owner_.empty()) {
            return false;
        }
        owner_ = task_id;
        return true;
    }

    void Release(std::string_view task_id) {
        if (owner_ == task_id) {
            owner_.clear();
        }
    }

    bool busy() const { return !owner_.empty(); }
    const std::string& owner() const { return owner_; }

private:
    std::string owner_;
};

} // namespace landrop::core

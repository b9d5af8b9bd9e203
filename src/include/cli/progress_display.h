#pragma once

#include <core/model/feedback/transfer_progress.h>

namespace landrop::cli {

class ProgressDisplay {
public:
    void UpdateProgress(const core::feedback::TransferProgress& progress);
    void ClearProgress();

    bool active() const { return active_; }

private:
    void printProgress(const core::feedback::TransferProgress& progress);

    bool active_{false};
};

} // namespace landrop::cli

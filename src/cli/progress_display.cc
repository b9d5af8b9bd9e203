#include <cli/progress_display.h>
#include <iomanip>
#include <iostream>
#include <string>

namespace landrop::cli {

void ProgressDisplay::printProgress(const core::feedback::TransferProgress& progress) {
    std::cout << "\rTransfer " << progress.task_id.substr(0, 8) << " | " << std::fixed
              << std::setprecision(1) << progress.progress * 100.0 << "%"
              << " | " << progress.transferred << " / " << progress.total << " bytes"
              << " | " << std::setprecision(2) << progress.throughput / (1024.0 * 1024.0)
              << " MiB/s" << std::flush;
}

void ProgressDisplay::UpdateProgress(const core::feedback::TransferProgress& progress) {
    printProgress(progress);
    active_ = true;
}

// 清除进度信息
void ProgressDisplay::ClearProgress() {
    if (!active_) {
        return;
    }
    std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
    active_ = false;
}

} // namespace landrop::cli

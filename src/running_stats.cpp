#include "running_stats.hpp"

#include <algorithm>

namespace cen {

RunningStats::RunningStats() {
    current_.window_start = Clock::now();
}

void RunningStats::record(const MotionEvent& ev, bool anomaly) {
    std::lock_guard<std::mutex> lock(mu_);
    current_.events++;
    current_.total_motion_area += static_cast<std::uint64_t>(std::max(ev.motion_area, 0));
    current_.max_motion_area = std::max(current_.max_motion_area, ev.motion_area);
    current_.max_contours = std::max(current_.max_contours, ev.num_contours);
    if (anomaly) current_.anomalies++;
}

StatsSnapshot RunningStats::drain() {
    std::lock_guard<std::mutex> lock(mu_);
    StatsSnapshot out = current_;
    out.window_end = Clock::now();
    current_ = StatsSnapshot{};
    current_.window_start = out.window_end;
    return out;
}

StatsSnapshot RunningStats::peek() const {
    std::lock_guard<std::mutex> lock(mu_);
    StatsSnapshot out = current_;
    out.window_end = Clock::now();
    return out;
}

}  // namespace cen

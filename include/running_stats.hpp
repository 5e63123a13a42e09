#pragma once

#include <cstdint>
#include <mutex>

#include "frame_types.hpp"
#include "utils.hpp"

namespace cen {

struct StatsSnapshot {
    std::uint64_t events{0};  // passed the throttle, sent or not
    std::uint64_t total_motion_area{0};
    int max_motion_area{0};
    int max_contours{0};
    std::uint64_t anomalies{0};
    Clock::time_point window_start{};
    Clock::time_point window_end{};

    double average_motion_area() const {
        return events ? static_cast<double>(total_motion_area) / static_cast<double>(events) : 0.0;
    }
};

// Shared between the monitor loop (record) and the summary thread (drain).
class RunningStats {
public:
    RunningStats();

    void record(const MotionEvent& ev, bool anomaly);

    // Returns the counters accumulated so far and zeroes them in the same
    // critical section.
    StatsSnapshot drain();
    StatsSnapshot peek() const;

private:
    mutable std::mutex mu_;
    StatsSnapshot current_;
};

}  // namespace cen

#pragma once

#include <opencv2/core.hpp>

#include "utils.hpp"

namespace cen {

// One detected instance of above-threshold change between consecutive frames.
struct MotionEvent {
    Clock::time_point timestamp{};
    cv::Mat frame;          // BGR image, empty when not captured
    int motion_area{0};     // sum of qualifying contour areas
    int num_contours{0};    // contours at or above the sensitivity threshold
};

struct MotionScore {
    int motion_area{0};
    int num_contours{0};
};

}  // namespace cen

#include "motion_sampler.hpp"

#include <iostream>
#include <thread>

#include <opencv2/imgproc.hpp>

#include "errors.hpp"
#include "signals.hpp"

namespace cen {

CameraSource::CameraSource(const std::string& device) : device_(device) {
    // Allow numeric index or URL
    try {
        size_t used = 0;
        int idx = std::stoi(device_, &used);
        if (used != device_.size()) throw std::invalid_argument(device_);
        cap_.open(idx);
    } catch (const std::logic_error&) {
        cap_.open(device_);
    }
    if (!cap_.isOpened()) {
        throw ConfigError("Unable to open camera device " + device_);
    }
}

CameraSource::~CameraSource() {
    release();
}

CaptureStatus CameraSource::read(cv::Mat& out) {
    if (!cap_.isOpened()) return CaptureStatus::kClosed;
    if (!cap_.read(out) || out.empty()) return CaptureStatus::kFailed;
    return CaptureStatus::kFrame;
}

void CameraSource::release() {
    if (cap_.isOpened()) cap_.release();
}

MotionScore score_contour_areas(const std::vector<double>& areas, int sensitivity) {
    MotionScore score;
    for (double area : areas) {
        if (area >= sensitivity) {
            score.motion_area += static_cast<int>(area);
            score.num_contours++;
        }
    }
    return score;
}

MotionScore score_frame_pair(const cv::Mat& prev_gray, const cv::Mat& gray, int sensitivity, double diff_threshold) {
    cv::Mat diff, mask;
    cv::absdiff(prev_gray, gray, diff);
    cv::threshold(diff, mask, diff_threshold, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<double> areas;
    areas.reserve(contours.size());
    for (const auto& c : contours) areas.push_back(cv::contourArea(c));
    return score_contour_areas(areas, sensitivity);
}

cv::Mat to_gray(const cv::Mat& frame) {
    cv::Mat gray;
    switch (frame.channels()) {
        case 1: gray = frame.clone(); break;
        case 4: cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY); break;
        default: cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY); break;
    }
    return gray;
}

MotionSampler::MotionSampler(std::unique_ptr<FrameSource> source, SamplerConfig cfg)
    : source_(std::move(source)), cfg_(std::move(cfg)) {
    if (!cfg_.cancelled) cfg_.cancelled = shutdown_requested;
}

MotionSampler::~MotionSampler() {
    close();
}

std::optional<MotionEvent> MotionSampler::next() {
    while (!closed_ && !cfg_.cancelled()) {
        cv::Mat frame;
        CaptureStatus st = source_->read(frame);
        if (st == CaptureStatus::kClosed) return std::nullopt;
        if (st == CaptureStatus::kFailed) {
            // Once per failure streak.
            if (!read_failing_) {
                std::cerr << "[WARN] Capture read failed, retrying..." << std::endl;
                read_failing_ = true;
            }
            std::this_thread::sleep_for(cfg_.retry_delay);
            continue;
        }
        if (read_failing_) {
            std::cout << "[INFO] Capture recovered" << std::endl;
            read_failing_ = false;
        }

        cv::Mat gray = to_gray(frame);
        // A resolution change restarts the baseline.
        if (prev_gray_.empty() || prev_gray_.size() != gray.size()) {
            prev_gray_ = gray;
            continue;
        }

        MotionScore score = score_frame_pair(prev_gray_, gray, cfg_.sensitivity, cfg_.diff_threshold);
        prev_gray_ = gray;

        if (score.motion_area > 0) {
            MotionEvent ev;
            ev.timestamp = Clock::now();
            ev.frame = frame;
            ev.motion_area = score.motion_area;
            ev.num_contours = score.num_contours;
            return ev;
        }
    }
    return std::nullopt;
}

void MotionSampler::close() {
    if (closed_) return;
    closed_ = true;
    if (source_) source_->release();
}

}  // namespace cen

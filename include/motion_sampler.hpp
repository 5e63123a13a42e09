#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/videoio.hpp>

#include "frame_types.hpp"

namespace cen {

enum class CaptureStatus { kFrame, kFailed, kClosed };

class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual CaptureStatus read(cv::Mat& out) = 0;
    virtual void release() = 0;
    virtual std::string name() const = 0;
};

// cv::VideoCapture over a device index ("0") or a stream URL.
class CameraSource final : public FrameSource {
public:
    // Throws ConfigError when the device cannot be opened.
    explicit CameraSource(const std::string& device);
    ~CameraSource() override;

    CaptureStatus read(cv::Mat& out) override;
    void release() override;
    std::string name() const override { return device_; }

private:
    std::string device_;
    cv::VideoCapture cap_;
};

struct SamplerConfig {
    int sensitivity{500};            // minimum contour area
    double diff_threshold{25.0};     // per-pixel intensity change
    std::chrono::milliseconds retry_delay{100};
    std::function<bool()> cancelled; // empty: process shutdown flag
};

MotionScore score_contour_areas(const std::vector<double>& areas, int sensitivity);
MotionScore score_frame_pair(const cv::Mat& prev_gray, const cv::Mat& gray, int sensitivity, double diff_threshold);

// Single-channel copy of a BGR, BGRA or already-gray frame.
cv::Mat to_gray(const cv::Mat& frame);

// Pull-based stream of motion events over a frame source it owns.
class MotionSampler {
public:
    MotionSampler(std::unique_ptr<FrameSource> source, SamplerConfig cfg);
    ~MotionSampler();

    MotionSampler(const MotionSampler&) = delete;
    MotionSampler& operator=(const MotionSampler&) = delete;

    // Blocks until motion is seen. nullopt once closed or cancelled.
    std::optional<MotionEvent> next();

    void close();
    bool closed() const { return closed_; }

private:
    std::unique_ptr<FrameSource> source_;
    SamplerConfig cfg_;
    cv::Mat prev_gray_;
    bool closed_{false};
    bool read_failing_{false};
};

}  // namespace cen

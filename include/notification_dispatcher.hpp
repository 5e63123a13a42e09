#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "frame_types.hpp"
#include "mail_transport.hpp"
#include "running_stats.hpp"

namespace cen {

struct DispatchConfig {
    std::string to;
    std::string sender;
    std::string subject{"CEN motion detected"};
    std::string body{"Motion was detected by your camera."};
    bool attach_snapshot{false};
    int min_interval_seconds{60};
    int anomaly_threshold{5};
    int jpeg_quality{90};
};

// Monotonic; wall-clock steps do not move the cooldown.
using MonoClock = std::chrono::steady_clock;

// Global cooldown between sent notifications.
class Throttle {
public:
    explicit Throttle(std::chrono::seconds min_interval);

    bool ready(MonoClock::time_point now) const;
    void mark_sent(MonoClock::time_point now) { last_sent_at_ = now; }
    std::optional<MonoClock::time_point> last_sent_at() const { return last_sent_at_; }

private:
    std::chrono::seconds min_interval_;
    std::optional<MonoClock::time_point> last_sent_at_;
};

enum class DispatchResult { kSent, kSuppressed };

bool is_anomaly(int num_contours, int anomaly_threshold);

class NotificationDispatcher {
public:
    using NowFn = std::function<MonoClock::time_point()>;

    NotificationDispatcher(DispatchConfig cfg, MailTransport& mail, RunningStats& stats, NowFn now = {});

    // Throws SendError when the transport fails; stats stay updated.
    DispatchResult on_event(const MotionEvent& ev);

    MailMessage compose(const MotionEvent& ev, bool anomaly) const;

    const Throttle& throttle() const { return throttle_; }

private:
    std::optional<Attachment> snapshot(const MotionEvent& ev) const;

    DispatchConfig cfg_;
    MailTransport& mail_;
    RunningStats& stats_;
    NowFn now_;
    Throttle throttle_;
};

}  // namespace cen

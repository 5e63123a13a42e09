#include "notification_dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <opencv2/imgcodecs.hpp>

namespace cen {

Throttle::Throttle(std::chrono::seconds min_interval)
    : min_interval_(std::max(min_interval, std::chrono::seconds(1))) {}

bool Throttle::ready(MonoClock::time_point now) const {
    if (!last_sent_at_) return true;
    return now - *last_sent_at_ >= min_interval_;
}

bool is_anomaly(int num_contours, int anomaly_threshold) {
    return num_contours >= std::max(1, anomaly_threshold);
}

NotificationDispatcher::NotificationDispatcher(DispatchConfig cfg, MailTransport& mail, RunningStats& stats, NowFn now)
    : cfg_(std::move(cfg)),
      mail_(mail),
      stats_(stats),
      now_(now ? std::move(now) : NowFn([] { return MonoClock::now(); })),
      throttle_(std::chrono::seconds(cfg_.min_interval_seconds)) {}

std::optional<Attachment> NotificationDispatcher::snapshot(const MotionEvent& ev) const {
    if (!cfg_.attach_snapshot || ev.frame.empty()) return std::nullopt;
    Attachment a;
    a.filename = "snapshot.jpg";
    a.mime_type = "image/jpeg";
    try {
        if (!cv::imencode(".jpg", ev.frame, a.data, {cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality})) {
            return std::nullopt;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Snapshot encoding failed: " << e.what() << std::endl;
        return std::nullopt;
    }
    return a;
}

MailMessage NotificationDispatcher::compose(const MotionEvent& ev, bool anomaly) const {
    MailMessage msg;
    msg.to = cfg_.to;
    msg.from = cfg_.sender;
    msg.subject = anomaly ? "[ANOMALY] " + cfg_.subject : cfg_.subject;

    std::ostringstream body;
    body << cfg_.body << "\n\n";
    body << "Detected at: " << format_utc_iso(ev.timestamp) << "\n";
    body << "Motion area: " << ev.motion_area << "\n";
    body << "Contours: " << ev.num_contours << "\n";
    if (anomaly) {
        body << "Anomaly: contour count reached the threshold of " << std::max(1, cfg_.anomaly_threshold) << "\n";
    }
    msg.body = body.str();
    msg.attachment = snapshot(ev);
    return msg;
}

DispatchResult NotificationDispatcher::on_event(const MotionEvent& ev) {
    if (!throttle_.ready(now_())) return DispatchResult::kSuppressed;

    const bool anomaly = is_anomaly(ev.num_contours, cfg_.anomaly_threshold);
    stats_.record(ev, anomaly);

    mail_.send(compose(ev, anomaly));
    throttle_.mark_sent(now_());
    return DispatchResult::kSent;
}

}  // namespace cen

#include "summary_scheduler.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>


namespace cen {

MailMessage compose_summary(const StatsSnapshot& snap, const SummaryConfig& cfg) {
    MailMessage msg;
    msg.to = cfg.to;
    msg.from = cfg.sender;
    msg.subject = cfg.subject;

    std::ostringstream body;
    body << "Motion summary from " << format_utc_iso(snap.window_start) << " to "
         << format_utc_iso(snap.window_end) << "\n\n";
    body << "Events dispatched: " << snap.events << "\n";
    body << "Total motion area: " << snap.total_motion_area << "\n";
    body << "Average motion area: " << std::fixed << std::setprecision(1) << snap.average_motion_area() << "\n";
    body << "Max motion area: " << snap.max_motion_area << "\n";
    body << "Max contours: " << snap.max_contours << "\n";
    body << "Anomalies: " << snap.anomalies << "\n";
    msg.body = body.str();
    return msg;
}

SummaryScheduler::SummaryScheduler(RunningStats& stats, MailTransport& mail, SummaryConfig cfg)
    : stats_(stats), mail_(mail), cfg_(std::move(cfg)) {}

SummaryScheduler::~SummaryScheduler() {
    stop();
}

void SummaryScheduler::start() {
    if (worker_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = false;
    }
    worker_ = std::thread(&SummaryScheduler::run, this);
}

void SummaryScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void SummaryScheduler::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        if (cv_.wait_for(lock, cfg_.period, [this] { return stopping_; })) break;
        lock.unlock();
        tick();
        lock.lock();
    }
}

bool SummaryScheduler::tick() {
    ticks_++;
    if (!cfg_.enabled) return false;

    StatsSnapshot snap = stats_.drain();
    try {
        mail_.send(compose_summary(snap, cfg_));
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Summary send failed, counters reset anyway: " << e.what() << std::endl;
        return false;
    }
    std::cout << "[INFO] Summary sent (" << snap.events << " notifications, " << snap.anomalies
              << " anomalies)" << std::endl;
    return true;
}

}  // namespace cen

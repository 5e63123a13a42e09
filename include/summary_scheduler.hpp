#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "mail_transport.hpp"
#include "running_stats.hpp"

namespace cen {

struct SummaryConfig {
    bool enabled{true};
    std::chrono::milliseconds period{std::chrono::hours(1)};
    std::string to;
    std::string sender;
    std::string subject{"CEN hourly summary"};
};

MailMessage compose_summary(const StatsSnapshot& snap, const SummaryConfig& cfg);

// Background task that drains RunningStats into a summary mail once per
// period, independent of event arrival.
class SummaryScheduler {
public:
    SummaryScheduler(RunningStats& stats, MailTransport& mail, SummaryConfig cfg);
    ~SummaryScheduler();

    SummaryScheduler(const SummaryScheduler&) = delete;
    SummaryScheduler& operator=(const SummaryScheduler&) = delete;

    void start();
    // Wakes the sleeping thread and joins it.
    void stop();

    // One period's work. Returns true when a summary was sent.
    bool tick();

    std::uint64_t ticks() const { return ticks_.load(); }

private:
    void run();

    RunningStats& stats_;
    MailTransport& mail_;
    SummaryConfig cfg_;

    std::thread worker_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::atomic<std::uint64_t> ticks_{0};
};

}  // namespace cen

#include <gtest/gtest.h>

#include <memory>

#include "app.hpp"
#include "fakes.hpp"
#include "running_stats.hpp"

using namespace cen;
using namespace cen::testing;

namespace {

const cv::Rect kBox(20, 20, 40, 30);

std::unique_ptr<MotionSampler> sampler_over(std::vector<cv::Mat> frames) {
    SamplerConfig cfg;
    cfg.sensitivity = 100;
    cfg.retry_delay = std::chrono::milliseconds(1);
    cfg.cancelled = [] { return false; };
    return std::make_unique<MotionSampler>(std::make_unique<ScriptedSource>(std::move(frames)), cfg);
}

// blank -> box -> blank -> box yields three motion events.
std::vector<cv::Mat> three_events() {
    return {blank_frame(), frame_with_boxes({kBox}), blank_frame(), frame_with_boxes({kBox})};
}

DispatchConfig dispatch_config(int min_interval) {
    DispatchConfig cfg;
    cfg.to = "owner@example.com";
    cfg.subject = "Motion";
    cfg.body = "Something moved.";
    cfg.min_interval_seconds = min_interval;
    return cfg;
}

}  // namespace

TEST(MonitorLoop, ThrottledEventsAreSuppressed) {
    FakeTransport mail;
    RunningStats stats;
    const MonoClock::time_point fixed{std::chrono::hours(1000)};
    NotificationDispatcher dispatcher(dispatch_config(60), mail, stats, [&] { return fixed; });
    auto sampler = sampler_over(three_events());

    LoopStats st = run_monitor_loop(*sampler, dispatcher);

    EXPECT_EQ(st.events, 3u);
    EXPECT_EQ(st.sent, 1u);
    EXPECT_EQ(st.suppressed, 2u);
    EXPECT_EQ(st.failed, 0u);
    EXPECT_EQ(mail.count(), 1u);
    EXPECT_EQ(stats.peek().events, 1u);
}

TEST(MonitorLoop, EveryEventSentWhenClockAdvances) {
    FakeTransport mail;
    RunningStats stats;
    MonoClock::time_point now{std::chrono::hours(1000)};
    NotificationDispatcher dispatcher(dispatch_config(60), mail, stats, [&] {
        now += std::chrono::seconds(61);
        return now;
    });
    auto sampler = sampler_over(three_events());

    LoopStats st = run_monitor_loop(*sampler, dispatcher);

    EXPECT_EQ(st.events, 3u);
    EXPECT_EQ(st.sent, 3u);
    EXPECT_EQ(st.suppressed, 0u);
    EXPECT_EQ(mail.count(), 3u);
}

TEST(MonitorLoop, SendFailureDoesNotStopLoop) {
    FakeTransport mail;
    mail.fail = true;
    RunningStats stats;
    const MonoClock::time_point fixed{std::chrono::hours(1000)};
    NotificationDispatcher dispatcher(dispatch_config(60), mail, stats, [&] { return fixed; });
    auto sampler = sampler_over(three_events());

    LoopStats st = run_monitor_loop(*sampler, dispatcher);

    // Failed sends do not arm the throttle, so each event retries.
    EXPECT_EQ(st.events, 3u);
    EXPECT_EQ(st.failed, 3u);
    EXPECT_EQ(st.sent, 0u);
    EXPECT_EQ(mail.count(), 0u);
}

TEST(MonitorLoop, NoMotionNoEvents) {
    FakeTransport mail;
    RunningStats stats;
    NotificationDispatcher dispatcher(dispatch_config(60), mail, stats);
    auto sampler = sampler_over({blank_frame(), blank_frame(), blank_frame()});

    LoopStats st = run_monitor_loop(*sampler, dispatcher);

    EXPECT_EQ(st.events, 0u);
    EXPECT_EQ(mail.count(), 0u);
}

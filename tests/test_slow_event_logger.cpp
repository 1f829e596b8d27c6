// =============================================================================
// FILE: tests/test_slow_event_logger.cpp
// =============================================================================
#include <gtest/gtest.h>
#include "common/slow_event_logger.h"
#include <thread>

using namespace asterisk_live;

namespace {

Config thresholds(int warn, int error, int critical) {
    Config c;
    c.slow_event_warn_threshold = Millisecs(warn);
    c.slow_event_error_threshold = Millisecs(error);
    c.slow_event_critical_threshold = Millisecs(critical);
    return c;
}

} // namespace

TEST(SlowEventLogger, FastDispatchIsOnlyCounted) {
    SlowEventLogger logger(thresholds(1000, 2000, 3000));
    {
        SlowEventLogger::Timer timer(logger, TimedStage::kDispatch, "Newchannel");
    }
    EXPECT_EQ(logger.stats().timed_count.load(), 1u);
    EXPECT_EQ(logger.stats().warn_count.load(), 0u);
    EXPECT_EQ(logger.stats().slow_dispatches.load(), 0u);
}

TEST(SlowEventLogger, TimerReportsOverWarn) {
    SlowEventLogger logger(thresholds(1, 10000, 100000));
    {
        SlowEventLogger::Timer timer(logger, TimedStage::kDispatch, "Hangup");
        std::this_thread::sleep_for(Millisecs(5));
    }
    EXPECT_EQ(logger.stats().warn_count.load(), 1u);
    EXPECT_EQ(logger.stats().error_count.load(), 0u);
    EXPECT_EQ(logger.stats().slow_dispatches.load(), 1u);
}

TEST(SlowEventLogger, SeverityBandsAndStages) {
    SlowEventLogger logger(thresholds(10, 100, 500));
    logger.record(TimedStage::kDispatch, "Newstate", Millisecs(9));
    logger.record(TimedStage::kDispatch, "Link", Millisecs(10));
    logger.record(TimedStage::kSnapshot, "Status", Millisecs(150));
    logger.record(TimedStage::kAction, "show version", Millisecs(700));

    const auto& st = logger.stats();
    EXPECT_EQ(st.timed_count.load(), 4u);
    EXPECT_EQ(st.warn_count.load(), 1u);
    EXPECT_EQ(st.error_count.load(), 1u);
    EXPECT_EQ(st.critical_count.load(), 1u);
    EXPECT_EQ(st.slow_dispatches.load(), 1u);
    EXPECT_EQ(st.slow_snapshots.load(), 1u);
    EXPECT_EQ(st.slow_actions.load(), 1u);
    EXPECT_EQ(st.max_duration_ms.load(), 700u);
}

TEST(SlowEventLogger, KeepsSlowestSample) {
    SlowEventLogger logger(thresholds(10, 100, 500));
    EXPECT_FALSE(logger.slowest().has_value());

    logger.record(TimedStage::kSnapshot, "QueueStatus", Millisecs(40));
    logger.record(TimedStage::kDispatch, "Join", Millisecs(3));

    auto s = logger.slowest();
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->stage, TimedStage::kSnapshot);
    EXPECT_EQ(s->subject, "QueueStatus");
    EXPECT_EQ(s->elapsed.count(), 40);
    EXPECT_STREQ(timed_stage_name(s->stage), "SNAPSHOT");
}

TEST(SlowEventLogger, ThresholdsChangeAtRuntime) {
    SlowEventLogger logger(Config{});
    logger.set_thresholds({Millisecs(10), Millisecs(100), Millisecs(500)});

    auto th = logger.thresholds();
    EXPECT_EQ(th.warn.count(), 10);
    EXPECT_EQ(th.error.count(), 100);
    EXPECT_EQ(th.critical.count(), 500);

    logger.record(TimedStage::kDispatch, "Hangup", Millisecs(20));
    EXPECT_EQ(logger.stats().warn_count.load(), 1u);
}

TEST(SlowEventLogger, FinishIsIdempotent) {
    SlowEventLogger logger(thresholds(10000, 20000, 30000));
    SlowEventLogger::Timer timer(logger, TimedStage::kSnapshot, "Status");
    std::this_thread::sleep_for(Millisecs(3));
    timer.finish();
    timer.finish();

    EXPECT_EQ(logger.stats().timed_count.load(), 1u);
    EXPECT_GE(logger.stats().max_duration_ms.load(), 3u);
}

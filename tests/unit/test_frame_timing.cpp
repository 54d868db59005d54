#include <gtest/gtest.h>

// frame_timing is an internal header in src/core/
#include "core/frame_timing.hpp"

#include <tandem/app.hpp>
#include <tandem/registry.hpp>
#include <tandem/resource_keys.hpp>

#include <chrono>

#include "log_capture.hpp"

using namespace tandem;
using namespace std::chrono_literals;

TEST(LoopTimer, TickMeasuresSincePrevious) {
    const LoopTimer::TimePoint t0{};
    LoopTimer                  timer(t0);

    EXPECT_DOUBLE_EQ(timer.tick(t0 + 20ms), 20.0);
    EXPECT_DOUBLE_EQ(timer.tick(t0 + 25ms), 5.0);
    EXPECT_DOUBLE_EQ(timer.tick(t0 + 25ms), 0.0);
}

TEST(LoopTimer, ResetRestartsMeasurement) {
    const LoopTimer::TimePoint t0{};
    LoopTimer                  timer(t0);
    timer.reset(t0 + 100ms);
    EXPECT_DOUBLE_EQ(timer.tick(t0 + 110ms), 10.0);
}

TEST(FrameTiming, DefaultThresholdWhenUnset) {
    Registry reg;
    EXPECT_DOUBLE_EQ(stall_threshold_ms(reg), DEFAULT_STALL_THRESHOLD_MS);
    EXPECT_DOUBLE_EQ(DEFAULT_STALL_THRESHOLD_MS, 16.67);
}

TEST(FrameTiming, StalledFrameWarnsOnce) {
    Registry reg;
    ASSERT_TRUE(set_stall_threshold_ms(16.67, reg));
    test::LogCapture capture;

    EXPECT_TRUE(record_render_frame(30.0, reg));
    EXPECT_EQ(capture.count(LogLevel::Warning), 1u);
    EXPECT_TRUE(capture.contains("30.00ms"));
    EXPECT_TRUE(capture.contains("16.67ms"));
}

TEST(FrameTiming, FastFrameIsSilent) {
    Registry reg;
    ASSERT_TRUE(set_stall_threshold_ms(16.67, reg));
    test::LogCapture capture;

    EXPECT_FALSE(record_render_frame(10.0, reg));
    EXPECT_FALSE(record_render_frame(16.67, reg));
    EXPECT_EQ(capture.count(LogLevel::Warning), 0u);
}

TEST(FrameTiming, OneWarningPerStalledFrame) {
    Registry         reg;
    test::LogCapture capture;

    const double frames[] = {30.0, 5.0, 40.0, 12.0, 17.0};
    for (double ms : frames) {
        record_render_frame(ms, reg);
    }
    EXPECT_EQ(capture.count(LogLevel::Warning), 3u);
}

TEST(FrameTiming, ThresholdChangeAppliesToNextFrame) {
    Registry         reg;
    test::LogCapture capture;

    EXPECT_TRUE(record_render_frame(20.0, reg));
    ASSERT_TRUE(set_stall_threshold_ms(33.0, reg));
    EXPECT_FALSE(record_render_frame(20.0, reg));
    EXPECT_EQ(capture.count(LogLevel::Warning), 1u);
}

TEST(FrameTiming, RenderFramePublishesLatestDuration) {
    Registry reg;
    EXPECT_DOUBLE_EQ(latest_duration_ms(keys::RENDER_MS, reg), 0.0);

    record_render_frame(12.0, reg);
    EXPECT_DOUBLE_EQ(latest_duration_ms(keys::RENDER_MS, reg), 12.0);
    record_render_frame(8.0, reg);
    EXPECT_DOUBLE_EQ(latest_duration_ms(keys::RENDER_MS, reg), 8.0);
}

TEST(FrameTiming, EventFramePublishesLatestDuration) {
    Registry reg;
    record_event_frame(0.5, reg);
    EXPECT_DOUBLE_EQ(latest_duration_ms(keys::EVENT_MS, reg), 0.5);
}

TEST(FrameTiming, WrongTypedDurationSlotIsReported) {
    Registry reg;
    ASSERT_EQ(reg.register_resource(keys::RENDER_MS, 3), InsertResult::Inserted);
    test::LogCapture capture;

    record_render_frame(5.0, reg);
    EXPECT_EQ(capture.count(LogLevel::Error), 1u);
    EXPECT_EQ(reg.get<int>(keys::RENDER_MS).value_or(0), 3);
    EXPECT_DOUBLE_EQ(latest_duration_ms(keys::RENDER_MS, reg), 0.0);
}

TEST(FrameTiming, RateFromDuration) {
    EXPECT_DOUBLE_EQ(rate_from_ms(20.0), 50.0);
    EXPECT_DOUBLE_EQ(rate_from_ms(1000.0), 1.0);
    EXPECT_DOUBLE_EQ(rate_from_ms(0.0), 0.0);
    EXPECT_DOUBLE_EQ(rate_from_ms(-4.0), 0.0);
}

// The App statics read the shared registry.
TEST(FrameTiming, AppRatesFollowPublishedDurations) {
    auto& reg = Registry::instance();
    reg.remove(keys::RENDER_MS);
    reg.remove(keys::EVENT_MS);

    EXPECT_DOUBLE_EQ(App::render_fps(), 0.0);
    EXPECT_DOUBLE_EQ(App::event_fps(), 0.0);

    EXPECT_EQ(reg.publish(keys::RENDER_MS, 20.0), PublishResult::Created);
    EXPECT_EQ(reg.publish(keys::EVENT_MS, 4.0), PublishResult::Created);
    EXPECT_DOUBLE_EQ(App::render_ms(), 20.0);
    EXPECT_DOUBLE_EQ(App::render_fps(), 50.0);
    EXPECT_DOUBLE_EQ(App::event_fps(), 250.0);

    reg.remove(keys::RENDER_MS);
    reg.remove(keys::EVENT_MS);
}

TEST(FrameTiming, AppStallThresholdRoundTrip) {
    auto& reg = Registry::instance();
    reg.remove(keys::STALL_THRESHOLD_MS);

    EXPECT_DOUBLE_EQ(App::stall_threshold(), DEFAULT_STALL_THRESHOLD_MS);
    App::set_stall_threshold(8.0);
    EXPECT_DOUBLE_EQ(App::stall_threshold(), 8.0);

    reg.remove(keys::STALL_THRESHOLD_MS);
}

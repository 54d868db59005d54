#pragma once

#include <chrono>
#include <string_view>
#include <tandem/registry.hpp>

namespace tandem
{

// One frame at 60 Hz.
inline constexpr double DEFAULT_STALL_THRESHOLD_MS = 16.67;

// Measures the wall-clock time between consecutive loop iterations.
class LoopTimer
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    LoopTimer() : last_(Clock::now()) {}
    explicit LoopTimer(TimePoint start) : last_(start) {}

    // Milliseconds since the previous tick (or since construction/reset).
    double tick() { return tick(Clock::now()); }
    double tick(TimePoint now);

    void reset(TimePoint start = Clock::now()) { last_ = start; }

   private:
    TimePoint last_;
};

// Render side of an iteration: compares elapsed_ms against the stall
// threshold (one warning per stalled frame) and publishes it as the latest
// render duration.  Returns true when the frame stalled.
bool record_render_frame(double elapsed_ms, Registry& registry = Registry::instance());

// Control side of an iteration: publishes the latest control duration.
void record_event_frame(double elapsed_ms, Registry& registry = Registry::instance());

// Current threshold, DEFAULT_STALL_THRESHOLD_MS while none was published.
double stall_threshold_ms(Registry& registry = Registry::instance());

bool set_stall_threshold_ms(double threshold_ms, Registry& registry = Registry::instance());

// Latest duration published under key, 0 when there is none.
double latest_duration_ms(std::string_view key, Registry& registry = Registry::instance());

// Iterations per second for a duration; 0 for an absent or non-positive one.
double rate_from_ms(double duration_ms);

}   // namespace tandem

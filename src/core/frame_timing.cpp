#include "frame_timing.hpp"

#include <tandem/logger.hpp>
#include <tandem/resource_keys.hpp>

namespace tandem
{

double LoopTimer::tick(TimePoint now)
{
    std::chrono::duration<double, std::milli> elapsed = now - last_;
    last_                                             = now;
    return elapsed.count();
}

bool record_render_frame(double elapsed_ms, Registry& registry)
{
    const double threshold = stall_threshold_ms(registry);
    const bool   stalled   = elapsed_ms > threshold;
    if (stalled)
    {
        TANDEM_LOG_WARN("render", "Frame took {}ms, over the {}ms stall threshold", elapsed_ms,
                        threshold);
    }

    if (registry.publish(keys::RENDER_MS, elapsed_ms) == PublishResult::TypeMismatch)
    {
        TANDEM_LOG_ERROR("render", "Slot {} does not hold a duration", keys::RENDER_MS);
    }
    return stalled;
}

void record_event_frame(double elapsed_ms, Registry& registry)
{
    if (registry.publish(keys::EVENT_MS, elapsed_ms) == PublishResult::TypeMismatch)
    {
        TANDEM_LOG_ERROR("event", "Slot {} does not hold a duration", keys::EVENT_MS);
    }
}

double stall_threshold_ms(Registry& registry)
{
    return registry.get<double>(keys::STALL_THRESHOLD_MS).value_or(DEFAULT_STALL_THRESHOLD_MS);
}

bool set_stall_threshold_ms(double threshold_ms, Registry& registry)
{
    return registry.publish(keys::STALL_THRESHOLD_MS, threshold_ms) != PublishResult::TypeMismatch;
}

double latest_duration_ms(std::string_view key, Registry& registry)
{
    return registry.get<double>(key).value_or(0.0);
}

double rate_from_ms(double duration_ms)
{
    if (duration_ms <= 0.0)
    {
        return 0.0;
    }
    return 1000.0 / duration_ms;
}

}   // namespace tandem

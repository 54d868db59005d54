#pragma once

#include <string_view>

// Well-known registry keys used by the runtime.  Keys are hierarchical paths;
// application code should pick keys outside the "tandem/" prefix.
namespace tandem::keys
{

// WindowHandle (std::unique_ptr<Window>)
inline constexpr std::string_view WINDOW = "tandem/glfw/window";

// double, milliseconds of the latest control-loop iteration
inline constexpr std::string_view EVENT_MS = "tandem/window/event_ms";

// double, milliseconds of the latest render-loop iteration
inline constexpr std::string_view RENDER_MS = "tandem/window/render_ms";

// double, milliseconds above which a render iteration counts as a stall
inline constexpr std::string_view STALL_THRESHOLD_MS = "tandem/window/stall_threshold_ms";

// ThreadNameTable
inline constexpr std::string_view THREAD_NAMES = "tandem/app/thread_names";

}   // namespace tandem::keys

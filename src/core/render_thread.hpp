#pragma once

#include <functional>
#include <future>
#include <tandem/registry.hpp>

namespace tandem
{

struct RenderThreadHooks
{
    std::function<void()> init;
    std::function<void()> loop;
};

// Body of the render thread.
//
// Binds the window's context, loads the runtime's GL entry points, runs the
// init hook and then fulfils `ready`.  Frames are produced until the window's
// should-close flag is set, after which `exited` is fulfilled.  A failure
// during initialization is delivered through `ready`; a failure inside the
// frame loop closes the window and is delivered through `exited`.
void run_render_thread(RenderThreadHooks  hooks,
                       std::promise<void> ready,
                       std::promise<void> exited,
                       Registry&          registry);

}   // namespace tandem

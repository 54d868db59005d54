#include "render_thread.hpp"

#include <exception>
#include <stdexcept>
#include <tandem/gl_loader.hpp>
#include <tandem/logger.hpp>
#include <tandem/resource_keys.hpp>
#include <tandem/thread_names.hpp>
#include <tandem/window.hpp>

#include "frame_timing.hpp"

namespace tandem
{

namespace
{

void release_window_context(Registry& registry)
{
    registry.with_mutate<WindowHandle>(keys::WINDOW,
                                       [](WindowHandle& window) { window->release_context(); });
}

void request_close(Registry& registry)
{
    registry.with_mutate<WindowHandle>(keys::WINDOW,
                                       [](WindowHandle& window) { window->set_should_close(true); });
}

// The name entry goes with the thread; the next thread gets a fresh token.
void forget_render_thread_name(Registry& registry)
{
    if (!clear_current_thread_name(registry))
    {
        TANDEM_LOG_DEBUG("render", "Render thread had no name entry to drop");
    }
}

bool window_open(Registry& registry)
{
    return registry
        .with_read<WindowHandle>(keys::WINDOW,
                                 [](const WindowHandle& window) { return !window->should_close(); })
        .value_or(false);
}

}   // namespace

void run_render_thread(RenderThreadHooks  hooks,
                       std::promise<void> ready,
                       std::promise<void> exited,
                       Registry&          registry)
{
    if (!set_current_thread_name("render", registry))
    {
        TANDEM_LOG_WARN("render", "Could not name the render thread");
    }

    gl::RuntimeFunctions gl_fns;
    try
    {
        const bool bound = registry.with_mutate<WindowHandle>(
            keys::WINDOW, [](WindowHandle& window) { window->make_context_current(); });
        if (!bound)
        {
            throw std::runtime_error("No window registered for the render thread");
        }

        const gl::Resolver resolve = [&registry](const char* name) -> ProcAddress
        {
            return registry
                .with_mutate<WindowHandle>(keys::WINDOW,
                                           [name](WindowHandle& window)
                                           { return window->get_proc_address(name); })
                .value_or(nullptr);
        };
        if (!gl::load_runtime_functions(gl_fns, resolve))
        {
            throw std::runtime_error("Failed to load OpenGL entry points");
        }

        if (hooks.init)
        {
            hooks.init();
        }
    }
    catch (const std::exception& e)
    {
        TANDEM_LOG_CRITICAL("render", "Render initialization failed: {}", e.what());
        release_window_context(registry);
        forget_render_thread_name(registry);
        ready.set_exception(std::current_exception());
        exited.set_value();
        return;
    }

    TANDEM_LOG_DEBUG("render", "Render thread initialized");
    ready.set_value();

    LoopTimer timer;
    try
    {
        while (window_open(registry))
        {
            record_render_frame(timer.tick(), registry);

            auto size = registry.with_read<WindowHandle>(
                keys::WINDOW, [](const WindowHandle& window) { return window->size(); });
            if (size)
            {
                gl_fns.viewport(0, 0, size->width, size->height);
            }

            if (hooks.loop)
            {
                hooks.loop();
            }

            registry.with_mutate<WindowHandle>(keys::WINDOW,
                                               [](WindowHandle& window) { window->swap_buffers(); });
        }
    }
    catch (const std::exception& e)
    {
        TANDEM_LOG_CRITICAL("render", "Render loop failed: {}", e.what());
        request_close(registry);
        release_window_context(registry);
        forget_render_thread_name(registry);
        exited.set_exception(std::current_exception());
        return;
    }

    TANDEM_LOG_DEBUG("render", "Render thread exiting");
    release_window_context(registry);
    forget_render_thread_name(registry);
    exited.set_value();
}

}   // namespace tandem

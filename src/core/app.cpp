#include <chrono>
#include <cstdlib>
#include <exception>
#include <future>
#include <mutex>
#include <stdexcept>
#include <tandem/app.hpp>
#include <tandem/logger.hpp>
#include <tandem/registry.hpp>
#include <tandem/resource_keys.hpp>
#include <tandem/thread_names.hpp>
#include <thread>

#include "frame_timing.hpp"
#include "render_thread.hpp"

namespace tandem
{

namespace
{

std::once_flag g_logger_env_once;

// Each shim owns its hook and forwards backend arguments only when the hook
// was provided.
void install_callback_shims(Window& window, WindowCallbacks callbacks)
{
    window.set_size_callback(
        [hook = std::move(callbacks.window_size)](int width, int height)
        {
            if (hook)
                hook(width, height);
        });
    window.set_pos_callback(
        [hook = std::move(callbacks.window_pos)](int x, int y)
        {
            if (hook)
                hook(x, y);
        });
    window.set_close_callback(
        [hook = std::move(callbacks.window_close)]()
        {
            if (hook)
                hook();
        });
    window.set_key_callback(
        [hook = std::move(callbacks.key)](int key, int scancode, int action, int mods)
        {
            if (hook)
                hook(key, scancode, action, mods);
        });
    window.set_mouse_button_callback(
        [hook = std::move(callbacks.mouse_button)](int button, int action, int mods)
        {
            if (hook)
                hook(button, action, mods);
        });
    window.set_cursor_pos_callback(
        [hook = std::move(callbacks.cursor_pos)](double x, double y)
        {
            if (hook)
                hook(x, y);
        });
    window.set_scroll_callback(
        [hook = std::move(callbacks.scroll)](double x_offset, double y_offset)
        {
            if (hook)
                hook(x_offset, y_offset);
        });
}

[[noreturn]] void abort_duplicate_instance()
{
    TANDEM_LOG_CRITICAL("app", "An App instance already exists; only one may run per process");
    std::abort();
}

}   // namespace

// ─── AppRuntime: state shared by build(), exec() and the destructor ──────────
struct App::AppRuntime
{
    Registry&                 registry;
    std::unique_ptr<Platform> platform;
    std::function<void()>     event_init;
    std::function<void()>     event_loop;

    std::thread        render_thread;
    std::future<void>  render_exited;
    AppState           state = AppState::Built;
    mutable std::mutex state_mutex;

    explicit AppRuntime(Registry& r) : registry(r) {}
};

// ─── AppBuilder ──────────────────────────────────────────────────────────────

AppBuilder::AppBuilder(AppConfig config) : config_(std::move(config)) {}

AppBuilder::AppBuilder(int width, int height, std::string title)
{
    config_.width  = width;
    config_.height = height;
    config_.title  = std::move(title);
}

AppBuilder::~AppBuilder() = default;

AppBuilder& AppBuilder::set_render_init(std::function<void()> f)
{
    hooks_.render_init = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_render_loop(std::function<void()> f)
{
    hooks_.render_loop = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_event_init(std::function<void()> f)
{
    hooks_.event_init = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_event_loop(std::function<void()> f)
{
    hooks_.event_loop = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_window_size_callback(SizeCallback f)
{
    callbacks_.window_size = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_window_pos_callback(PosCallback f)
{
    callbacks_.window_pos = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_window_close_callback(CloseCallback f)
{
    callbacks_.window_close = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_key_callback(KeyCallback f)
{
    callbacks_.key = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_mouse_button_callback(MouseButtonCallback f)
{
    callbacks_.mouse_button = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_cursor_pos_callback(CursorPosCallback f)
{
    callbacks_.cursor_pos = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_scroll_callback(ScrollCallback f)
{
    callbacks_.scroll = std::move(f);
    return *this;
}

AppBuilder& AppBuilder::set_platform(std::unique_ptr<Platform> platform)
{
    platform_ = std::move(platform);
    return *this;
}

App AppBuilder::build()
{
    std::call_once(g_logger_env_once, configure_logger_from_env);

    auto& registry = Registry::instance();
    if (!set_current_thread_name("control", registry))
    {
        TANDEM_LOG_WARN("app", "Could not name the control thread");
    }

    if (registry.exists(keys::WINDOW))
    {
        abort_duplicate_instance();
    }

    // Window backend
    TANDEM_LOG_DEBUG("app", "Initializing window backend...");
    auto runtime = std::make_unique<App::AppRuntime>(registry);
    runtime->platform = platform_ ? std::move(platform_) : make_glfw_platform();

    WindowConfig window_config{.width     = config_.width,
                               .height    = config_.height,
                               .title     = config_.title,
                               .resizable = config_.resizable,
                               .vsync     = config_.vsync};
    WindowHandle window = runtime->platform->create_window(window_config);
    if (!window)
    {
        throw std::runtime_error("Failed to create window '" + config_.title + "'");
    }
    if (registry.register_resource(keys::WINDOW, std::move(window)) != InsertResult::Inserted)
    {
        abort_duplicate_instance();
    }

    if (!registry.exists(keys::STALL_THRESHOLD_MS)
        && !set_stall_threshold_ms(config_.stall_threshold_ms, registry))
    {
        TANDEM_LOG_WARN("app", "Could not apply the configured stall threshold");
    }

    // Callbacks
    TANDEM_LOG_DEBUG("app", "Registering window callbacks...");
    registry.with_mutate<WindowHandle>(
        keys::WINDOW,
        [this](WindowHandle& w) { install_callback_shims(*w, std::move(callbacks_)); });
    callbacks_ = {};

    // Render thread
    TANDEM_LOG_DEBUG("app", "Starting render thread...");
    std::promise<void> ready;
    std::promise<void> exited;
    auto               render_ready = ready.get_future();
    runtime->render_exited          = exited.get_future();
    runtime->event_init             = std::move(hooks_.event_init);
    runtime->event_loop             = std::move(hooks_.event_loop);

    RenderThreadHooks render_hooks{.init = std::move(hooks_.render_init),
                                   .loop = std::move(hooks_.render_loop)};
    hooks_ = {};

    runtime->render_thread = std::thread(run_render_thread,
                                         std::move(render_hooks),
                                         std::move(ready),
                                         std::move(exited),
                                         std::ref(registry));

    // Startup handshake: nothing is shown before render init has returned.
    try
    {
        render_ready.get();
    }
    catch (const std::exception&)
    {
        runtime->render_thread.join();
        registry.remove(keys::WINDOW);
        throw;
    }

    TANDEM_LOG_DEBUG("app", "Showing window");
    registry.with_mutate<WindowHandle>(keys::WINDOW, [](WindowHandle& w) { w->show(); });

    return App(std::move(runtime));
}

// ─── App ─────────────────────────────────────────────────────────────────────

App::App(std::unique_ptr<AppRuntime> runtime) : runtime_(std::move(runtime)) {}

App::App(App&& other) noexcept = default;

App& App::operator=(App&& other) noexcept
{
    if (this != &other)
    {
        shutdown();
        runtime_ = std::move(other.runtime_);
    }
    return *this;
}

App::~App()
{
    shutdown();
}

AppState App::state() const
{
    if (!runtime_)
    {
        return AppState::Stopped;
    }
    std::lock_guard<std::mutex> lock(runtime_->state_mutex);
    return runtime_->state;
}

void App::exec()
{
    {
        if (!runtime_)
        {
            TANDEM_LOG_WARN("app", "exec() called on a moved-from App");
            return;
        }
        std::lock_guard<std::mutex> lock(runtime_->state_mutex);
        if (runtime_->state != AppState::Built)
        {
            TANDEM_LOG_WARN("app", "exec() called on an App that already ran");
            return;
        }
        runtime_->state = AppState::Running;
    }

    TANDEM_LOG_DEBUG("app", "Starting event loop...");
    if (runtime_->event_init)
    {
        runtime_->event_init();
    }

    auto&     registry = runtime_->registry;
    LoopTimer timer;
    while (true)
    {
        if (runtime_->render_exited.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            break;
        }
        std::this_thread::yield();

        record_event_frame(timer.tick(), registry);

        if (runtime_->event_loop)
        {
            runtime_->event_loop();
        }
        runtime_->platform->poll_events();
    }
    TANDEM_LOG_DEBUG("app", "Event loop exited");

    runtime_->render_thread.join();
    {
        std::lock_guard<std::mutex> lock(runtime_->state_mutex);
        runtime_->state = AppState::Stopped;
    }
    runtime_->render_exited.get();
}

void App::shutdown()
{
    if (!runtime_)
    {
        return;
    }

    auto& registry = runtime_->registry;
    if (runtime_->render_thread.joinable())
    {
        TANDEM_LOG_DEBUG("app", "Stopping render thread");
        exit();
        runtime_->render_thread.join();
    }
    registry.remove(keys::WINDOW);
    runtime_->platform.reset();
    runtime_.reset();
}

void App::exit()
{
    Registry::instance().with_mutate<WindowHandle>(
        keys::WINDOW, [](WindowHandle& w) { w->set_should_close(true); });
}

WindowSize App::window_size()
{
    return Registry::instance()
        .with_read<WindowHandle>(keys::WINDOW, [](const WindowHandle& w) { return w->size(); })
        .value_or(WindowSize{});
}

WindowPosition App::window_position()
{
    return Registry::instance()
        .with_read<WindowHandle>(keys::WINDOW,
                                 [](const WindowHandle& w) { return w->position(); })
        .value_or(WindowPosition{});
}

void App::set_window_size(int width, int height)
{
    Registry::instance().with_mutate<WindowHandle>(
        keys::WINDOW, [=](WindowHandle& w) { w->set_size(width, height); });
}

void App::set_cursor_mode(CursorMode mode)
{
    Registry::instance().with_mutate<WindowHandle>(
        keys::WINDOW, [mode](WindowHandle& w) { w->set_cursor_mode(mode); });
}

double App::event_ms()
{
    return latest_duration_ms(keys::EVENT_MS);
}

double App::render_ms()
{
    return latest_duration_ms(keys::RENDER_MS);
}

double App::event_fps()
{
    return rate_from_ms(event_ms());
}

double App::render_fps()
{
    return rate_from_ms(render_ms());
}

double App::stall_threshold()
{
    return stall_threshold_ms();
}

void App::set_stall_threshold(double threshold_ms)
{
    if (!set_stall_threshold_ms(threshold_ms))
    {
        TANDEM_LOG_ERROR("app", "Slot {} does not hold a duration", keys::STALL_THRESHOLD_MS);
    }
}

void App::set_current_thread_name(const std::string& name)
{
    if (!tandem::set_current_thread_name(name))
    {
        TANDEM_LOG_ERROR("app", "Slot {} does not hold a thread name table", keys::THREAD_NAMES);
    }
}

std::string App::current_thread_name()
{
    return tandem::current_thread_name();
}

ProcAddress App::get_proc_address(const char* name)
{
    return Registry::instance()
        .with_mutate<WindowHandle>(keys::WINDOW,
                                   [name](WindowHandle& w) { return w->get_proc_address(name); })
        .value_or(nullptr);
}

}   // namespace tandem

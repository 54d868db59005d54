#pragma once

#include <functional>
#include <memory>
#include <string>
#include <tandem/window.hpp>

namespace tandem
{

struct AppConfig
{
    int         width              = 800;
    int         height             = 600;
    std::string title              = "tandem";
    double      stall_threshold_ms = 16.67;   // applied unless already published
    bool        vsync              = true;
    bool        resizable          = true;
};

// Lifecycle hooks.  render_* run on the render thread, event_* on the thread
// that calls App::exec().
struct LoopHooks
{
    std::function<void()> render_init;   // once, after the context is current
    std::function<void()> render_loop;   // every frame, before present
    std::function<void()> event_init;    // once, at the start of exec()
    std::function<void()> event_loop;    // every control iteration
};

// Window event hooks, dispatched on the control thread while it polls events.
struct WindowCallbacks
{
    SizeCallback        window_size;
    PosCallback         window_pos;
    CloseCallback       window_close;
    KeyCallback         key;
    MouseButtonCallback mouse_button;
    CursorPosCallback   cursor_pos;
    ScrollCallback      scroll;
};

enum class AppState
{
    Built,
    Running,
    Stopped,
};

class App;

// Collects configuration and hooks, then starts the runtime.
//
// Usage:
//   auto app = tandem::AppBuilder(800, 600, "demo")
//                  .set_render_init(init_scene)
//                  .set_render_loop(draw_scene)
//                  .build();
//   app.exec();
class AppBuilder
{
   public:
    explicit AppBuilder(AppConfig config = {});
    AppBuilder(int width, int height, std::string title);
    ~AppBuilder();

    AppBuilder(const AppBuilder&)            = delete;
    AppBuilder& operator=(const AppBuilder&) = delete;

    AppBuilder& set_render_init(std::function<void()> f);
    AppBuilder& set_render_loop(std::function<void()> f);
    AppBuilder& set_event_init(std::function<void()> f);

    // While the window is being moved or resized some platforms block event
    // polling, which also stalls this hook until the interaction ends.
    AppBuilder& set_event_loop(std::function<void()> f);

    AppBuilder& set_window_size_callback(SizeCallback f);
    AppBuilder& set_window_pos_callback(PosCallback f);
    AppBuilder& set_window_close_callback(CloseCallback f);
    AppBuilder& set_key_callback(KeyCallback f);
    AppBuilder& set_mouse_button_callback(MouseButtonCallback f);
    AppBuilder& set_cursor_pos_callback(CursorPosCallback f);
    AppBuilder& set_scroll_callback(ScrollCallback f);

    // Windowing backend; GLFW when none is given.
    AppBuilder& set_platform(std::unique_ptr<Platform> platform);

    const AppConfig& config() const { return config_; }

    // Creates the window, starts the render thread and returns once the
    // render thread has finished its one-time initialization and the window
    // is visible.  Building while another App owns the window aborts the
    // process.  Throws std::runtime_error when the backend fails and rethrows
    // whatever the render init hook throws.
    App build();

   private:
    AppConfig                 config_;
    LoopHooks                 hooks_;
    WindowCallbacks           callbacks_;
    std::unique_ptr<Platform> platform_;
};

class App
{
   public:
    App(App&& other) noexcept;
    App& operator=(App&& other) noexcept;
    ~App();

    App(const App&)            = delete;
    App& operator=(const App&) = delete;

    // Control loop: runs until the render thread leaves its frame loop.
    // Rethrows an exception that ended the render thread.
    void exec();
    void run() { exec(); }

    AppState state() const;

    // ─── Process-wide queries and commands ──────────────────────────────────
    // All go through the registry; none requires an App reference.

    // Ask both loops to stop.  Observed by the render loop on its next frame.
    static void exit();

    static WindowSize     window_size();
    static WindowPosition window_position();
    static void           set_window_size(int width, int height);
    static void           set_cursor_mode(CursorMode mode);

    // Milliseconds of the latest control / render iteration, 0 before the first.
    static double event_ms();
    static double render_ms();

    // 1000 / ms, or 0 when no duration was published yet.
    static double event_fps();
    static double render_fps();

    static double stall_threshold();
    static void   set_stall_threshold(double threshold_ms);

    static void        set_current_thread_name(const std::string& name);
    static std::string current_thread_name();

    // Graphics entry point lookup for user loaders.  Only meaningful on the
    // render thread, where the context is current.
    static ProcAddress get_proc_address(const char* name);

   private:
    friend class AppBuilder;

    struct AppRuntime;
    explicit App(std::unique_ptr<AppRuntime> runtime);

    void shutdown();

    std::unique_ptr<AppRuntime> runtime_;
};

}   // namespace tandem

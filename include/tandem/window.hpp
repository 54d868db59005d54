#pragma once

#include <functional>
#include <memory>
#include <string>

namespace tandem
{

struct WindowSize
{
    int width  = 0;
    int height = 0;

    bool operator==(const WindowSize&) const = default;
};

struct WindowPosition
{
    int x = 0;
    int y = 0;

    bool operator==(const WindowPosition&) const = default;
};

enum class CursorMode
{
    Normal,
    Hidden,
    Disabled,   // hidden and confined to the window
};

// Key, action and modifier values are the GLFW constants (GLFW_KEY_*,
// GLFW_PRESS/RELEASE/REPEAT, GLFW_MOD_*).
using SizeCallback        = std::function<void(int width, int height)>;
using PosCallback         = std::function<void(int x, int y)>;
using CloseCallback       = std::function<void()>;
using KeyCallback         = std::function<void(int key, int scancode, int action, int mods)>;
using MouseButtonCallback = std::function<void(int button, int action, int mods)>;
using CursorPosCallback   = std::function<void(double x, double y)>;
using ScrollCallback      = std::function<void(double x_offset, double y_offset)>;

using ProcAddress = void (*)();

struct WindowConfig
{
    int         width     = 800;
    int         height    = 600;
    std::string title     = "tandem";
    bool        resizable = true;
    bool        vsync     = true;
};

// One OS window with a graphics context.  Every setter replaces the previous
// callback for that event kind.  Callbacks fire from Platform::poll_events()
// on the thread that polls.
class Window
{
   public:
    virtual ~Window() = default;

    virtual void show() = 0;
    virtual void hide() = 0;

    virtual WindowSize size() const                = 0;
    virtual void       set_size(int width, int height) = 0;

    virtual WindowPosition position() const           = 0;
    virtual void           set_position(int x, int y) = 0;

    virtual bool should_close() const         = 0;
    virtual void set_should_close(bool value) = 0;

    virtual void set_cursor_mode(CursorMode mode) = 0;

    // Bind / unbind the graphics context on the calling thread.  A context is
    // current on at most one thread at a time.
    virtual void        make_context_current()             = 0;
    virtual void        release_context()                  = 0;
    virtual ProcAddress get_proc_address(const char* name) = 0;
    virtual void        swap_buffers()                     = 0;

    virtual void set_size_callback(SizeCallback callback)                = 0;
    virtual void set_pos_callback(PosCallback callback)                  = 0;
    virtual void set_close_callback(CloseCallback callback)              = 0;
    virtual void set_key_callback(KeyCallback callback)                  = 0;
    virtual void set_mouse_button_callback(MouseButtonCallback callback) = 0;
    virtual void set_cursor_pos_callback(CursorPosCallback callback)     = 0;
    virtual void set_scroll_callback(ScrollCallback callback)            = 0;
};

// What the registry stores under keys::WINDOW.
using WindowHandle = std::unique_ptr<Window>;

// Windowing library state: window creation and the event pump.
class Platform
{
   public:
    virtual ~Platform() = default;

    // The window starts hidden.  Returns nullptr on failure.
    virtual std::unique_ptr<Window> create_window(const WindowConfig& config) = 0;

    // Dispatch queued events to the window callbacks on the calling thread.
    virtual void poll_events() = 0;
};

// Initializes GLFW.  Throws std::runtime_error when GLFW cannot start.
std::unique_ptr<Platform> make_glfw_platform();

}   // namespace tandem

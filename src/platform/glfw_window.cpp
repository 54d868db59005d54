#include "glfw_window.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <stdexcept>
#include <tandem/logger.hpp>

namespace tandem
{

namespace
{

void glfw_error_callback(int code, const char* description)
{
    TANDEM_LOG_ERROR("glfw", "GLFW error {}: {}", code, description);
}

int to_glfw_cursor_mode(CursorMode mode)
{
    switch (mode)
    {
        case CursorMode::Hidden:
            return GLFW_CURSOR_HIDDEN;
        case CursorMode::Disabled:
            return GLFW_CURSOR_DISABLED;
        case CursorMode::Normal:
        default:
            return GLFW_CURSOR_NORMAL;
    }
}

GlfwWindow* owner_of(GLFWwindow* window)
{
    return static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
}

}   // namespace

// ─── GlfwWindow ──────────────────────────────────────────────────────────────

GlfwWindow::GlfwWindow(GLFWwindow* window, bool vsync) : window_(window), vsync_(vsync)
{
    glfwSetWindowUserPointer(window_, this);

    glfwSetWindowSizeCallback(window_, size_callback);
    glfwSetWindowPosCallback(window_, pos_callback);
    glfwSetWindowCloseCallback(window_, close_callback);
    glfwSetKeyCallback(window_, key_callback);
    glfwSetMouseButtonCallback(window_, mouse_button_callback);
    glfwSetCursorPosCallback(window_, cursor_pos_callback);
    glfwSetScrollCallback(window_, scroll_callback);
}

GlfwWindow::~GlfwWindow()
{
    if (window_)
    {
        glfwSetWindowUserPointer(window_, nullptr);
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
}

void GlfwWindow::show()
{
    glfwShowWindow(window_);
}

void GlfwWindow::hide()
{
    glfwHideWindow(window_);
}

WindowSize GlfwWindow::size() const
{
    WindowSize result;
    glfwGetWindowSize(window_, &result.width, &result.height);
    return result;
}

void GlfwWindow::set_size(int width, int height)
{
    glfwSetWindowSize(window_, width, height);
}

WindowPosition GlfwWindow::position() const
{
    WindowPosition result;
    glfwGetWindowPos(window_, &result.x, &result.y);
    return result;
}

void GlfwWindow::set_position(int x, int y)
{
    glfwSetWindowPos(window_, x, y);
}

bool GlfwWindow::should_close() const
{
    return glfwWindowShouldClose(window_) == GLFW_TRUE;
}

void GlfwWindow::set_should_close(bool value)
{
    glfwSetWindowShouldClose(window_, value ? GLFW_TRUE : GLFW_FALSE);
}

void GlfwWindow::set_cursor_mode(CursorMode mode)
{
    glfwSetInputMode(window_, GLFW_CURSOR, to_glfw_cursor_mode(mode));
}

void GlfwWindow::make_context_current()
{
    glfwMakeContextCurrent(window_);
    glfwSwapInterval(vsync_ ? 1 : 0);
}

void GlfwWindow::release_context()
{
    if (glfwGetCurrentContext() == window_)
    {
        glfwMakeContextCurrent(nullptr);
    }
}

ProcAddress GlfwWindow::get_proc_address(const char* name)
{
    return glfwGetProcAddress(name);
}

void GlfwWindow::swap_buffers()
{
    glfwSwapBuffers(window_);
}

void GlfwWindow::set_size_callback(SizeCallback callback)
{
    on_size_ = std::move(callback);
}

void GlfwWindow::set_pos_callback(PosCallback callback)
{
    on_pos_ = std::move(callback);
}

void GlfwWindow::set_close_callback(CloseCallback callback)
{
    on_close_ = std::move(callback);
}

void GlfwWindow::set_key_callback(KeyCallback callback)
{
    on_key_ = std::move(callback);
}

void GlfwWindow::set_mouse_button_callback(MouseButtonCallback callback)
{
    on_mouse_button_ = std::move(callback);
}

void GlfwWindow::set_cursor_pos_callback(CursorPosCallback callback)
{
    on_cursor_pos_ = std::move(callback);
}

void GlfwWindow::set_scroll_callback(ScrollCallback callback)
{
    on_scroll_ = std::move(callback);
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwWindow::size_callback(GLFWwindow* window, int width, int height)
{
    auto* self = owner_of(window);
    if (self && self->on_size_)
    {
        self->on_size_(width, height);
    }
}

void GlfwWindow::pos_callback(GLFWwindow* window, int x, int y)
{
    auto* self = owner_of(window);
    if (self && self->on_pos_)
    {
        self->on_pos_(x, y);
    }
}

void GlfwWindow::close_callback(GLFWwindow* window)
{
    auto* self = owner_of(window);
    if (self && self->on_close_)
    {
        self->on_close_();
    }
}

void GlfwWindow::key_callback(GLFWwindow* window, int key, int scancode, int action, int mods)
{
    auto* self = owner_of(window);
    if (self && self->on_key_)
    {
        self->on_key_(key, scancode, action, mods);
    }
}

void GlfwWindow::mouse_button_callback(GLFWwindow* window, int button, int action, int mods)
{
    auto* self = owner_of(window);
    if (self && self->on_mouse_button_)
    {
        self->on_mouse_button_(button, action, mods);
    }
}

void GlfwWindow::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* self = owner_of(window);
    if (self && self->on_cursor_pos_)
    {
        self->on_cursor_pos_(x, y);
    }
}

void GlfwWindow::scroll_callback(GLFWwindow* window, double x_offset, double y_offset)
{
    auto* self = owner_of(window);
    if (self && self->on_scroll_)
    {
        self->on_scroll_(x_offset, y_offset);
    }
}

// ─── GlfwPlatform ────────────────────────────────────────────────────────────

GlfwPlatform::GlfwPlatform()
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
    {
        throw std::runtime_error("Failed to initialize GLFW");
    }
    TANDEM_LOG_DEBUG("glfw", "GLFW {} initialized", glfwGetVersionString());
}

GlfwPlatform::~GlfwPlatform()
{
    glfwTerminate();
}

std::unique_ptr<Window> GlfwPlatform::create_window(const WindowConfig& config)
{
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, config.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    GLFWwindow* window =
        glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
    if (!window)
    {
        TANDEM_LOG_ERROR("glfw", "Failed to create GLFW window '{}'", config.title);
        return nullptr;
    }
    return std::make_unique<GlfwWindow>(window, config.vsync);
}

void GlfwPlatform::poll_events()
{
    glfwPollEvents();
}

std::unique_ptr<Platform> make_glfw_platform()
{
    return std::make_unique<GlfwPlatform>();
}

}   // namespace tandem

#pragma once

#include <tandem/window.hpp>

struct GLFWwindow;

namespace tandem
{

class GlfwWindow final : public Window
{
   public:
    // Takes ownership of an already created GLFW window.
    GlfwWindow(GLFWwindow* window, bool vsync);
    ~GlfwWindow() override;

    GlfwWindow(const GlfwWindow&)            = delete;
    GlfwWindow& operator=(const GlfwWindow&) = delete;

    void show() override;
    void hide() override;

    WindowSize size() const override;
    void       set_size(int width, int height) override;

    WindowPosition position() const override;
    void           set_position(int x, int y) override;

    bool should_close() const override;
    void set_should_close(bool value) override;

    void set_cursor_mode(CursorMode mode) override;

    void        make_context_current() override;
    void        release_context() override;
    ProcAddress get_proc_address(const char* name) override;
    void        swap_buffers() override;

    void set_size_callback(SizeCallback callback) override;
    void set_pos_callback(PosCallback callback) override;
    void set_close_callback(CloseCallback callback) override;
    void set_key_callback(KeyCallback callback) override;
    void set_mouse_button_callback(MouseButtonCallback callback) override;
    void set_cursor_pos_callback(CursorPosCallback callback) override;
    void set_scroll_callback(ScrollCallback callback) override;

   private:
    GLFWwindow* window_ = nullptr;
    bool        vsync_  = true;

    SizeCallback        on_size_;
    PosCallback         on_pos_;
    CloseCallback       on_close_;
    KeyCallback         on_key_;
    MouseButtonCallback on_mouse_button_;
    CursorPosCallback   on_cursor_pos_;
    ScrollCallback      on_scroll_;

    // Static callback trampolines (GLFW uses C callbacks)
    static void size_callback(GLFWwindow* window, int width, int height);
    static void pos_callback(GLFWwindow* window, int x, int y);
    static void close_callback(GLFWwindow* window);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void scroll_callback(GLFWwindow* window, double x_offset, double y_offset);
};

class GlfwPlatform final : public Platform
{
   public:
    GlfwPlatform();
    ~GlfwPlatform() override;

    GlfwPlatform(const GlfwPlatform&)            = delete;
    GlfwPlatform& operator=(const GlfwPlatform&) = delete;

    std::unique_ptr<Window> create_window(const WindowConfig& config) override;
    void                    poll_events() override;
};

}   // namespace tandem

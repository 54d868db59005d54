// Coloured triangle plus a line, drawn on the render thread while the control
// thread watches the keyboard.  Hold Left Alt to print loop timings, press
// Escape to quit.

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>
#include <atomic>
#include <string>
#include <tandem/app.hpp>
#include <tandem/gl_loader.hpp>
#include <tandem/logger.hpp>
#include <tandem/registry.hpp>
#include <vector>

namespace
{

constexpr std::string_view VAO_KEY = "triangle/vao";

constexpr const char* VERTEX_SHADER = R"(
#version 330 core
layout (location = 0) in vec2 aPos;
layout (location = 1) in vec3 aColor;

out vec3 ourColor;

void main()
{
    gl_Position = vec4(aPos, 1.0, 1.0);
    ourColor = aColor;
}
)";

constexpr const char* FRAGMENT_SHADER = R"(
#version 330 core
in vec3 ourColor;
out vec4 FragColor;

void main()
{
    FragColor = vec4(ourColor, 1.0);
}
)";

// x, y, r, g, b
constexpr float VERTICES[] = {
    0.0f,  0.5f,  1.0f, 0.0f, 0.0f,   // triangle
    0.5f,  -0.5f, 0.0f, 1.0f, 0.0f,   //
    -0.5f, -0.5f, 0.0f, 0.0f, 1.0f,   //
    0.5f,  0.5f,  1.0f, 1.0f, 0.0f,   // line
    -0.5f, 0.5f,  0.0f, 1.0f, 1.0f,   //
};

struct SceneGl
{
    PFNGLCLEARCOLORPROC              ClearColor;
    PFNGLCLEARPROC                   Clear;
    PFNGLGENVERTEXARRAYSPROC         GenVertexArrays;
    PFNGLGENBUFFERSPROC              GenBuffers;
    PFNGLBINDVERTEXARRAYPROC         BindVertexArray;
    PFNGLBINDBUFFERPROC              BindBuffer;
    PFNGLBUFFERDATAPROC              BufferData;
    PFNGLENABLEVERTEXATTRIBARRAYPROC EnableVertexAttribArray;
    PFNGLVERTEXATTRIBPOINTERPROC     VertexAttribPointer;
    PFNGLCREATESHADERPROC            CreateShader;
    PFNGLSHADERSOURCEPROC            ShaderSource;
    PFNGLCOMPILESHADERPROC           CompileShader;
    PFNGLGETSHADERIVPROC             GetShaderiv;
    PFNGLGETSHADERINFOLOGPROC        GetShaderInfoLog;
    PFNGLCREATEPROGRAMPROC           CreateProgram;
    PFNGLATTACHSHADERPROC            AttachShader;
    PFNGLLINKPROGRAMPROC             LinkProgram;
    PFNGLGETPROGRAMIVPROC            GetProgramiv;
    PFNGLGETPROGRAMINFOLOGPROC       GetProgramInfoLog;
    PFNGLDELETESHADERPROC            DeleteShader;
    PFNGLUSEPROGRAMPROC              UseProgram;
    PFNGLDRAWARRAYSPROC              DrawArrays;
};

// Only touched on the render thread.
SceneGl gl{};

std::atomic<bool> alt_held{false};

void load_scene_gl()
{
    using tandem::gl::load;
    const tandem::gl::Resolver resolve = tandem::App::get_proc_address;

    gl.ClearColor              = load<PFNGLCLEARCOLORPROC>(resolve, "glClearColor");
    gl.Clear                   = load<PFNGLCLEARPROC>(resolve, "glClear");
    gl.GenVertexArrays         = load<PFNGLGENVERTEXARRAYSPROC>(resolve, "glGenVertexArrays");
    gl.GenBuffers              = load<PFNGLGENBUFFERSPROC>(resolve, "glGenBuffers");
    gl.BindVertexArray         = load<PFNGLBINDVERTEXARRAYPROC>(resolve, "glBindVertexArray");
    gl.BindBuffer              = load<PFNGLBINDBUFFERPROC>(resolve, "glBindBuffer");
    gl.BufferData              = load<PFNGLBUFFERDATAPROC>(resolve, "glBufferData");
    gl.EnableVertexAttribArray =
        load<PFNGLENABLEVERTEXATTRIBARRAYPROC>(resolve, "glEnableVertexAttribArray");
    gl.VertexAttribPointer = load<PFNGLVERTEXATTRIBPOINTERPROC>(resolve, "glVertexAttribPointer");
    gl.CreateShader        = load<PFNGLCREATESHADERPROC>(resolve, "glCreateShader");
    gl.ShaderSource        = load<PFNGLSHADERSOURCEPROC>(resolve, "glShaderSource");
    gl.CompileShader       = load<PFNGLCOMPILESHADERPROC>(resolve, "glCompileShader");
    gl.GetShaderiv         = load<PFNGLGETSHADERIVPROC>(resolve, "glGetShaderiv");
    gl.GetShaderInfoLog    = load<PFNGLGETSHADERINFOLOGPROC>(resolve, "glGetShaderInfoLog");
    gl.CreateProgram       = load<PFNGLCREATEPROGRAMPROC>(resolve, "glCreateProgram");
    gl.AttachShader        = load<PFNGLATTACHSHADERPROC>(resolve, "glAttachShader");
    gl.LinkProgram         = load<PFNGLLINKPROGRAMPROC>(resolve, "glLinkProgram");
    gl.GetProgramiv        = load<PFNGLGETPROGRAMIVPROC>(resolve, "glGetProgramiv");
    gl.GetProgramInfoLog   = load<PFNGLGETPROGRAMINFOLOGPROC>(resolve, "glGetProgramInfoLog");
    gl.DeleteShader        = load<PFNGLDELETESHADERPROC>(resolve, "glDeleteShader");
    gl.UseProgram          = load<PFNGLUSEPROGRAMPROC>(resolve, "glUseProgram");
    gl.DrawArrays          = load<PFNGLDRAWARRAYSPROC>(resolve, "glDrawArrays");
}

GLuint compile_shader(GLenum stage, const char* source, const char* label)
{
    GLuint shader = gl.CreateShader(stage);
    gl.ShaderSource(shader, 1, &source, nullptr);
    gl.CompileShader(shader);

    GLint success = GL_FALSE;
    gl.GetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint length = 0;
        gl.GetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        std::vector<char> log(static_cast<size_t>(length > 0 ? length : 1));
        gl.GetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
        TANDEM_LOG_ERROR("triangle", "{} shader compile error: {}", label, log.data());
    }
    return shader;
}

GLuint link_program(GLuint vs, GLuint fs)
{
    GLuint program = gl.CreateProgram();
    gl.AttachShader(program, vs);
    gl.AttachShader(program, fs);
    gl.LinkProgram(program);

    GLint success = GL_FALSE;
    gl.GetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        GLint length = 0;
        gl.GetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        std::vector<char> log(static_cast<size_t>(length > 0 ? length : 1));
        gl.GetProgramInfoLog(program, static_cast<GLsizei>(log.size()), nullptr, log.data());
        TANDEM_LOG_ERROR("triangle", "Program link error: {}", log.data());
    }
    return program;
}

void render_init()
{
    TANDEM_LOG_DEBUG("triangle", "Render init");
    load_scene_gl();

    GLuint vao = 0;
    GLuint vbo = 0;
    gl.GenVertexArrays(1, &vao);
    gl.GenBuffers(1, &vbo);
    gl.BindVertexArray(vao);
    gl.BindBuffer(GL_ARRAY_BUFFER, vbo);
    gl.BufferData(GL_ARRAY_BUFFER, sizeof(VERTICES), VERTICES, GL_STATIC_DRAW);

    constexpr GLsizei stride = 5 * sizeof(float);
    gl.EnableVertexAttribArray(0);
    gl.VertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, nullptr);
    gl.EnableVertexAttribArray(1);
    gl.VertexAttribPointer(1,
                           3,
                           GL_FLOAT,
                           GL_FALSE,
                           stride,
                           reinterpret_cast<const void*>(2 * sizeof(float)));
    gl.BindVertexArray(0);

    if (tandem::Registry::instance().register_resource(VAO_KEY, vao)
        != tandem::InsertResult::Inserted)
    {
        TANDEM_LOG_WARN("triangle", "{} was already registered", VAO_KEY);
    }

    GLuint vs      = compile_shader(GL_VERTEX_SHADER, VERTEX_SHADER, "Vertex");
    GLuint fs      = compile_shader(GL_FRAGMENT_SHADER, FRAGMENT_SHADER, "Fragment");
    GLuint program = link_program(vs, fs);
    gl.DeleteShader(vs);
    gl.DeleteShader(fs);
    gl.UseProgram(program);
}

void render_loop()
{
    gl.ClearColor(0.3f, 0.4f, 0.5f, 1.0f);
    gl.Clear(GL_COLOR_BUFFER_BIT);

    tandem::Registry::instance().with_read<GLuint>(VAO_KEY,
                                                   [](const GLuint& vao)
                                                   {
                                                       gl.BindVertexArray(vao);
                                                       gl.DrawArrays(GL_TRIANGLES, 0, 3);
                                                       gl.DrawArrays(GL_LINES, 3, 2);
                                                       gl.BindVertexArray(0);
                                                   });
}

void event_init()
{
    TANDEM_LOG_DEBUG("triangle", "Event init");
}

void event_loop()
{
    if (alt_held.load())
    {
        TANDEM_LOG_INFO("triangle",
                        "E_MS: {}  E_FPS: {}  R_MS: {}  R_FPS: {}",
                        tandem::App::event_ms(),
                        tandem::App::event_fps(),
                        tandem::App::render_ms(),
                        tandem::App::render_fps());
    }
}

void on_key(int key, int /*scancode*/, int action, int /*mods*/)
{
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
    {
        tandem::App::exit();
    }
    else if (key == GLFW_KEY_W && action == GLFW_PRESS)
    {
        TANDEM_LOG_INFO("triangle", "W key pressed");
    }
    else if (key == GLFW_KEY_LEFT_ALT)
    {
        alt_held.store(action != GLFW_RELEASE);
    }
}

}   // namespace

int main()
{
    tandem::Logger::instance().set_level(tandem::LogLevel::Debug);

    auto app = tandem::AppBuilder(800, 600, "Tandem Triangle")
                   .set_render_init(render_init)
                   .set_render_loop(render_loop)
                   .set_event_init(event_init)
                   .set_event_loop(event_loop)
                   .set_key_callback(on_key)
                   .build();
    app.exec();
    return 0;
}

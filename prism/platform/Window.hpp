#pragma once

#include <functional>
#include <string>
#include <unordered_map>

struct GLFWwindow;

namespace prism::platform
{
struct WindowSettings
{
    int width = 1280;
    int height = 720;
    bool vsync = true;
    std::string title = "Prism Viewer";
};

struct WindowCallbacks
{
    std::function<void(int, int)> framebufferResized;
    std::function<void(double)> scrolled;
};

/// Cursor movement since the previous PollInput while the left button stayed held.
struct DragDelta
{
    double dx = 0.0;
    double dy = 0.0;
    bool active = false;
};

/// GLFW window owning an OpenGL 4.5 core context and a per-frame input snapshot.
class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Open(const WindowSettings& settings, WindowCallbacks callbacks = {});
    void Close();

    /// Pumps GLFW events and advances key and cursor edge state.
    void PollInput();
    void Present() const;

    [[nodiscard]] bool ShouldClose() const;
    void RequestClose() const;

    [[nodiscard]] bool KeyDown(int key) const;
    /// True only on the frame |key| went down. The key is tracked from its first query.
    [[nodiscard]] bool KeyPressed(int key);
    [[nodiscard]] const DragDelta& Drag() const { return m_drag; }

    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }
    [[nodiscard]] float AspectRatio() const;
    [[nodiscard]] double TimeSeconds() const;

private:
    static Window* FromHandle(GLFWwindow* handle);

    GLFWwindow* m_handle = nullptr;
    WindowCallbacks m_callbacks;

    struct KeyEdge
    {
        bool down = false;
        bool pressed = false;
    };
    std::unordered_map<int, KeyEdge> m_keys;

    double m_cursorX = 0.0;
    double m_cursorY = 0.0;
    bool m_leftHeld = false;
    DragDelta m_drag;

    int m_fbWidth = 0;
    int m_fbHeight = 0;
};
} // namespace prism::platform

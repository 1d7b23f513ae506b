#include "prism/platform/Window.hpp"

#include <iostream>
#include <utility>

#include <GLFW/glfw3.h>

namespace prism::platform
{
namespace
{
void LogGlfwError(int code, const char* description)
{
    std::cerr << "[Window] GLFW error " << code << ": " << (description != nullptr ? description : "") << "\n";
}
} // namespace

Window::~Window()
{
    Close();
}

bool Window::Open(const WindowSettings& settings, WindowCallbacks callbacks)
{
    if (m_handle != nullptr)
    {
        return true;
    }

    glfwSetErrorCallback(LogGlfwError);
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "[Window] glfwInit failed.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_DEPTH_BITS, 24);
    glfwWindowHint(GLFW_SAMPLES, 4);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_handle = glfwCreateWindow(settings.width, settings.height, settings.title.c_str(), nullptr, nullptr);
    if (m_handle == nullptr)
    {
        std::cerr << "[Window] Could not create a " << settings.width << "x" << settings.height
                  << " window with an OpenGL 4.5 core context.\n";
        glfwTerminate();
        return false;
    }

    m_callbacks = std::move(callbacks);
    glfwMakeContextCurrent(m_handle);
    glfwSwapInterval(settings.vsync ? 1 : 0);
    glfwSetWindowUserPointer(m_handle, this);

    glfwSetFramebufferSizeCallback(m_handle, [](GLFWwindow* handle, int width, int height) {
        Window* self = FromHandle(handle);
        if (self == nullptr)
        {
            return;
        }
        self->m_fbWidth = width;
        self->m_fbHeight = height;
        if (self->m_callbacks.framebufferResized)
        {
            self->m_callbacks.framebufferResized(width, height);
        }
    });
    glfwSetScrollCallback(m_handle, [](GLFWwindow* handle, double, double yOffset) {
        Window* self = FromHandle(handle);
        if (self != nullptr && self->m_callbacks.scrolled)
        {
            self->m_callbacks.scrolled(yOffset);
        }
    });

    glfwGetFramebufferSize(m_handle, &m_fbWidth, &m_fbHeight);
    glfwGetCursorPos(m_handle, &m_cursorX, &m_cursorY);
    return true;
}

void Window::Close()
{
    if (m_handle == nullptr)
    {
        return;
    }
    glfwDestroyWindow(m_handle);
    m_handle = nullptr;
    m_keys.clear();
    glfwTerminate();
}

void Window::PollInput()
{
    glfwPollEvents();
    if (m_handle == nullptr)
    {
        return;
    }

    for (auto& [key, edge] : m_keys)
    {
        const bool down = glfwGetKey(m_handle, key) == GLFW_PRESS;
        edge.pressed = down && !edge.down;
        edge.down = down;
    }

    double x = 0.0;
    double y = 0.0;
    glfwGetCursorPos(m_handle, &x, &y);
    const bool leftHeld = glfwGetMouseButton(m_handle, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;

    m_drag = DragDelta{};
    if (leftHeld && m_leftHeld)
    {
        m_drag = DragDelta{x - m_cursorX, y - m_cursorY, true};
    }
    m_leftHeld = leftHeld;
    m_cursorX = x;
    m_cursorY = y;
}

void Window::Present() const
{
    if (m_handle != nullptr)
    {
        glfwSwapBuffers(m_handle);
    }
}

bool Window::ShouldClose() const
{
    return m_handle == nullptr || glfwWindowShouldClose(m_handle) == GLFW_TRUE;
}

void Window::RequestClose() const
{
    if (m_handle != nullptr)
    {
        glfwSetWindowShouldClose(m_handle, GLFW_TRUE);
    }
}

bool Window::KeyDown(int key) const
{
    return m_handle != nullptr && glfwGetKey(m_handle, key) == GLFW_PRESS;
}

bool Window::KeyPressed(int key)
{
    const auto [it, inserted] = m_keys.try_emplace(key);
    if (inserted)
    {
        // Seed with the current state so a key held at startup does not fire.
        it->second.down = KeyDown(key);
    }
    return it->second.pressed;
}

float Window::AspectRatio() const
{
    return m_fbHeight > 0 ? static_cast<float>(m_fbWidth) / static_cast<float>(m_fbHeight) : 0.0F;
}

double Window::TimeSeconds() const
{
    return glfwGetTime();
}

Window* Window::FromHandle(GLFWwindow* handle)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(handle));
}
} // namespace prism::platform

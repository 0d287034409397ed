#include "canopy/platform/Window.hpp"

#include <algorithm>
#include <iostream>

#include <GLFW/glfw3.h>

#include "canopy/core/EventBus.hpp"

namespace canopy::platform
{
namespace
{
Window* FromHandle(GLFWwindow* window)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

core::InputAction ToAction(int action)
{
    switch (action)
    {
        case GLFW_PRESS:
            return core::InputAction::Press;
        case GLFW_REPEAT:
            return core::InputAction::Repeat;
        default:
            return core::InputAction::Release;
    }
}

core::MouseButton ToButton(int button)
{
    switch (button)
    {
        case GLFW_MOUSE_BUTTON_RIGHT:
            return core::MouseButton::Right;
        case GLFW_MOUSE_BUTTON_MIDDLE:
            return core::MouseButton::Middle;
        default:
            return core::MouseButton::Left;
    }
}
} // namespace

Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const core::WindowConfig& config, core::EventBus* bus)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "[Window] Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_windowSize = glm::ivec2{config.width, config.height};
    m_window = glfwCreateWindow(config.width, config.height, config.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "[Window] Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    m_bus = bus;
    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, FramebufferResizeCallback);
    glfwSetWindowSizeCallback(m_window, WindowResizeCallback);
    glfwSetCursorPosCallback(m_window, CursorPosCallback);
    glfwSetMouseButtonCallback(m_window, MouseButtonCallback);
    glfwSetScrollCallback(m_window, ScrollCallback);
    glfwSetKeyCallback(m_window, KeyCallback);
    glfwGetFramebufferSize(m_window, &m_fbSize.x, &m_fbSize.y);

    SetVSync(config.vsync);
    return true;
}

void Window::Shutdown()
{
    if (m_window != nullptr)
    {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
        glfwTerminate();
    }
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

void Window::SetShouldClose(bool shouldClose) const
{
    if (m_window != nullptr)
    {
        glfwSetWindowShouldClose(m_window, shouldClose ? GLFW_TRUE : GLFW_FALSE);
    }
}

void Window::SetVSync(bool enabled) const
{
    glfwSwapInterval(enabled ? 1 : 0);
}

glm::vec2 Window::ToFramebuffer(double x, double y) const
{
    const glm::vec2 scale{
        static_cast<float>(m_fbSize.x) / static_cast<float>(std::max(m_windowSize.x, 1)),
        static_cast<float>(m_fbSize.y) / static_cast<float>(std::max(m_windowSize.y, 1)),
    };
    return glm::vec2{static_cast<float>(x) * scale.x, static_cast<float>(y) * scale.y};
}

void Window::FramebufferResizeCallback(GLFWwindow* window, int width, int height)
{
    Window* self = FromHandle(window);
    if (self == nullptr)
    {
        return;
    }
    self->m_fbSize = glm::ivec2{width, height};
    if (self->m_bus != nullptr)
    {
        core::InputEvent event;
        event.type = core::InputEventType::Resize;
        event.size = self->m_fbSize;
        self->m_bus->Publish(event);
    }
}

void Window::WindowResizeCallback(GLFWwindow* window, int width, int height)
{
    if (Window* self = FromHandle(window))
    {
        self->m_windowSize = glm::ivec2{width, height};
    }
}

void Window::CursorPosCallback(GLFWwindow* window, double x, double y)
{
    Window* self = FromHandle(window);
    if (self == nullptr)
    {
        return;
    }
    self->m_cursor = self->ToFramebuffer(x, y);
    if (self->m_bus != nullptr)
    {
        core::InputEvent event;
        event.type = core::InputEventType::MouseMove;
        event.pos = self->m_cursor;
        self->m_bus->Publish(event);
    }
}

void Window::MouseButtonCallback(GLFWwindow* window, int button, int action, int mods)
{
    Window* self = FromHandle(window);
    if (self == nullptr || self->m_bus == nullptr)
    {
        return;
    }
    core::InputEvent event;
    event.type = core::InputEventType::MouseButton;
    event.pos = self->m_cursor;
    event.button = ToButton(button);
    event.action = ToAction(action);
    event.mods = mods;
    self->m_bus->Publish(event);
}

void Window::ScrollCallback(GLFWwindow* window, double dx, double dy)
{
    Window* self = FromHandle(window);
    if (self == nullptr || self->m_bus == nullptr)
    {
        return;
    }
    core::InputEvent event;
    event.type = core::InputEventType::MouseScroll;
    event.pos = self->m_cursor;
    event.scroll = glm::vec2{static_cast<float>(dx), static_cast<float>(dy)};
    self->m_bus->Publish(event);
}

void Window::KeyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    Window* self = FromHandle(window);
    if (self == nullptr || self->m_bus == nullptr)
    {
        return;
    }
    core::InputEvent event;
    event.type = core::InputEventType::Key;
    event.key = key;
    event.action = ToAction(action);
    event.mods = mods;
    event.pos = self->m_cursor;
    self->m_bus->Publish(event);
}
} // namespace canopy::platform

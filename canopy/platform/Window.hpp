#pragma once

#include <glm/vec2.hpp>

#include "canopy/core/Config.hpp"

struct GLFWwindow;

namespace canopy::core
{
class EventBus;
}

namespace canopy::platform
{
// GLFW window with a current GL context. Input callbacks are translated into
// core::InputEvent and published on the bus; pointer positions are in
// framebuffer pixels.
class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const core::WindowConfig& config, core::EventBus* bus);
    void Shutdown();

    void PollEvents() const;
    void SwapBuffers() const;

    [[nodiscard]] bool ShouldClose() const;
    void SetShouldClose(bool shouldClose) const;
    void SetVSync(bool enabled) const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] glm::ivec2 FramebufferSize() const { return m_fbSize; }
    [[nodiscard]] glm::ivec2 WindowSize() const { return m_windowSize; }

private:
    static void FramebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void WindowResizeCallback(GLFWwindow* window, int width, int height);
    static void CursorPosCallback(GLFWwindow* window, double x, double y);
    static void MouseButtonCallback(GLFWwindow* window, int button, int action, int mods);
    static void ScrollCallback(GLFWwindow* window, double dx, double dy);
    static void KeyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);

    [[nodiscard]] glm::vec2 ToFramebuffer(double x, double y) const;

    GLFWwindow* m_window = nullptr;
    core::EventBus* m_bus = nullptr;
    glm::ivec2 m_windowSize{1280, 800};
    glm::ivec2 m_fbSize{1280, 800};
    glm::vec2 m_cursor{0.0F, 0.0F};
};
} // namespace canopy::platform

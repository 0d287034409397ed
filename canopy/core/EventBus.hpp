#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include <glm/vec2.hpp>

namespace canopy::core
{
enum class InputEventType : std::uint8_t
{
    MouseButton = 0,
    MouseMove,
    MouseScroll,
    Key,
    Resize,
    Count
};

enum class InputAction : std::uint8_t
{
    Release = 0,
    Press,
    Repeat
};

enum class MouseButton : std::uint8_t
{
    Left = 0,
    Right,
    Middle
};

struct InputEvent
{
    InputEventType type = InputEventType::MouseMove;
    glm::vec2 pos{0.0F, 0.0F};
    glm::vec2 scroll{0.0F, 0.0F};
    glm::ivec2 size{0, 0};
    MouseButton button = MouseButton::Left;
    InputAction action = InputAction::Press;
    int key = 0;
    int mods = 0;
};

// Events may be published from any thread (window callbacks); handlers only
// run inside DispatchQueued on the thread that owns the widget tree.
class EventBus
{
public:
    using Handler = std::function<void(const InputEvent&)>;

    void Subscribe(InputEventType type, Handler handler);
    void Publish(const InputEvent& event);
    void DispatchQueued();

    [[nodiscard]] std::size_t PendingCount() const;

private:
    std::array<std::vector<Handler>, static_cast<std::size_t>(InputEventType::Count)> m_handlers;
    std::vector<InputEvent> m_queue;
    mutable std::mutex m_queueMutex;
};
} // namespace canopy::core

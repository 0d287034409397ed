#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "canopy/core/EventBus.hpp"

namespace canopy::ui
{
class WidgetNode;

enum class WidgetEvent : std::uint8_t
{
    Press = 0,
    Release,
    Move,
    Enter,
    Leave,
    Scroll,
    Key
};

// Live input bindings of rendered widgets. Bindings are (re)made during the
// render pass and dropped for subtrees that are not drawn, so only visible
// nodes process input.
class EventRouter
{
public:
    using Handler = std::function<void(WidgetNode&, const core::InputEvent&)>;

    // Replaces any binding of the same node and event. The binding moves to
    // the end of the list, which is paint order, so later bindings are on top.
    void Connect(WidgetNode& node, WidgetEvent event, Handler handler);
    void DisconnectAll(WidgetNode& node, bool subtree);
    void Clear();

    [[nodiscard]] std::size_t BindingCount(const WidgetNode& node) const;
    [[nodiscard]] std::size_t TotalBindings() const { return m_bindings.size(); }
    [[nodiscard]] WidgetNode* Hovered() const { return m_hovered; }

    // Moves keyboard focus. The new holder emits Focused; nullptr clears it.
    void SetFocus(WidgetNode* node);
    [[nodiscard]] WidgetNode* Focused() const { return m_focused; }
    // Drops focus when it is held by `node` (or, with `subtree`, below it).
    void ReleaseFocus(const WidgetNode& node, bool subtree);

    void Dispatch(const core::InputEvent& event);

private:
    struct Binding
    {
        WidgetNode* node = nullptr;
        WidgetEvent event = WidgetEvent::Press;
        Handler handler;
    };

    [[nodiscard]] WidgetNode* TopmostAt(const glm::vec2& pos, const WidgetEvent* event) const;
    void Invoke(WidgetNode* node, WidgetEvent event, const core::InputEvent& input);
    void RemoveNode(const WidgetNode* node);
    void UpdateHover(const core::InputEvent& input);

    std::vector<Binding> m_bindings;
    WidgetNode* m_hovered = nullptr;
    WidgetNode* m_focused = nullptr;
};
} // namespace canopy::ui

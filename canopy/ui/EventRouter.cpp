#include "canopy/ui/EventRouter.hpp"

#include <algorithm>

#include "canopy/ui/WidgetNode.hpp"

namespace canopy::ui
{
namespace
{
bool InSubtree(const WidgetNode* node, const WidgetNode& root)
{
    for (const WidgetNode* n = node; n != nullptr; n = n->parent)
    {
        if (n == &root)
        {
            return true;
        }
    }
    return false;
}

bool AcceptsPointer(const WidgetNode& node, const glm::vec2& pos)
{
    return node.style.pointerEvents && !node.style.inactive && node.winBBox.Contains(pos);
}
} // namespace

void EventRouter::Connect(WidgetNode& node, WidgetEvent event, Handler handler)
{
    const auto it = std::find_if(m_bindings.begin(), m_bindings.end(),
        [&node, event](const Binding& b) { return b.node == &node && b.event == event; });
    if (it != m_bindings.end())
    {
        m_bindings.erase(it);
    }
    m_bindings.push_back(Binding{&node, event, std::move(handler)});
}

void EventRouter::DisconnectAll(WidgetNode& node, bool subtree)
{
    const auto remove = [&node, subtree](const Binding& b) {
        return subtree ? InSubtree(b.node, node) : b.node == &node;
    };
    m_bindings.erase(std::remove_if(m_bindings.begin(), m_bindings.end(), remove), m_bindings.end());
    if (m_hovered != nullptr && (subtree ? InSubtree(m_hovered, node) : m_hovered == &node))
    {
        m_hovered = nullptr;
    }
}

void EventRouter::Clear()
{
    m_bindings.clear();
    m_hovered = nullptr;
    m_focused = nullptr;
}

void EventRouter::SetFocus(WidgetNode* node)
{
    if (node == m_focused)
    {
        return;
    }
    if (m_focused != nullptr)
    {
        m_focused->focused = false;
        m_focused->MarkNeedsFullReRender();
    }
    m_focused = node;
    if (node != nullptr)
    {
        node->focused = true;
        node->MarkNeedsFullReRender();
        node->signals.Emit(WidgetSignal::Focused, *node);
    }
}

void EventRouter::ReleaseFocus(const WidgetNode& node, bool subtree)
{
    if (m_focused == nullptr)
    {
        return;
    }
    if (subtree ? InSubtree(m_focused, node) : m_focused == &node)
    {
        m_focused->focused = false;
        m_focused = nullptr;
    }
}

std::size_t EventRouter::BindingCount(const WidgetNode& node) const
{
    return static_cast<std::size_t>(
        std::count_if(m_bindings.begin(), m_bindings.end(), [&node](const Binding& b) { return b.node == &node; }));
}

WidgetNode* EventRouter::TopmostAt(const glm::vec2& pos, const WidgetEvent* event) const
{
    for (auto it = m_bindings.rbegin(); it != m_bindings.rend(); ++it)
    {
        if (event != nullptr && it->event != *event)
        {
            continue;
        }
        if (AcceptsPointer(*it->node, pos))
        {
            return it->node;
        }
    }
    return nullptr;
}

void EventRouter::Invoke(WidgetNode* node, WidgetEvent event, const core::InputEvent& input)
{
    if (node == nullptr)
    {
        return;
    }
    const auto it = std::find_if(m_bindings.begin(), m_bindings.end(),
        [node, event](const Binding& b) { return b.node == node && b.event == event; });
    if (it == m_bindings.end())
    {
        return;
    }
    // Handlers may rebind or delete nodes.
    const Handler handler = it->handler;
    handler(*node, input);
}

void EventRouter::UpdateHover(const core::InputEvent& input)
{
    WidgetNode* top = TopmostAt(input.pos, nullptr);
    if (top == m_hovered)
    {
        return;
    }
    WidgetNode* previous = m_hovered;
    m_hovered = top;
    Invoke(previous, WidgetEvent::Leave, input);
    Invoke(top, WidgetEvent::Enter, input);
}

void EventRouter::Dispatch(const core::InputEvent& event)
{
    switch (event.type)
    {
        case core::InputEventType::MouseButton:
        {
            const WidgetEvent kind = event.action == core::InputAction::Release ? WidgetEvent::Release : WidgetEvent::Press;
            Invoke(TopmostAt(event.pos, &kind), kind, event);
            break;
        }
        case core::InputEventType::MouseMove:
        {
            UpdateHover(event);
            std::vector<WidgetNode*> targets;
            for (const Binding& b : m_bindings)
            {
                if (b.event == WidgetEvent::Move)
                {
                    targets.push_back(b.node);
                }
            }
            for (WidgetNode* node : targets)
            {
                Invoke(node, WidgetEvent::Move, event);
            }
            break;
        }
        case core::InputEventType::MouseScroll:
        {
            const WidgetEvent kind = WidgetEvent::Scroll;
            Invoke(TopmostAt(event.pos, &kind), kind, event);
            break;
        }
        case core::InputEventType::Key:
        {
            std::vector<WidgetNode*> targets;
            for (const Binding& b : m_bindings)
            {
                if (b.event == WidgetEvent::Key)
                {
                    targets.push_back(b.node);
                }
            }
            for (WidgetNode* node : targets)
            {
                Invoke(node, WidgetEvent::Key, event);
            }
            break;
        }
        default:
            break;
    }
}
} // namespace canopy::ui

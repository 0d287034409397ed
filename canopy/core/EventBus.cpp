#include "canopy/core/EventBus.hpp"

namespace canopy::core
{
void EventBus::Subscribe(InputEventType type, Handler handler)
{
    m_handlers[static_cast<std::size_t>(type)].push_back(std::move(handler));
}

void EventBus::Publish(const InputEvent& event)
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_queue.push_back(event);
}

void EventBus::DispatchQueued()
{
    std::vector<InputEvent> pending;
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        pending.swap(m_queue);
    }

    for (const InputEvent& event : pending)
    {
        for (const Handler& handler : m_handlers[static_cast<std::size_t>(event.type)])
        {
            handler(event);
        }
    }
}

std::size_t EventBus::PendingCount() const
{
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_queue.size();
}
} // namespace canopy::core

#include "canopy/ui/Signals.hpp"

#include <algorithm>

namespace canopy::ui
{
int WidgetSignals::Connect(WidgetSignal signal, Callback callback)
{
    if (!callback || signal == WidgetSignal::Count)
    {
        return 0;
    }
    const int id = m_nextId++;
    m_observers[static_cast<std::size_t>(signal)].push_back(Observer{id, std::move(callback)});
    return id;
}

bool WidgetSignals::Disconnect(int id)
{
    for (auto& list : m_observers)
    {
        const auto it = std::find_if(list.begin(), list.end(), [id](const Observer& o) { return o.id == id; });
        if (it != list.end())
        {
            list.erase(it);
            return true;
        }
    }
    return false;
}

void WidgetSignals::DisconnectAll()
{
    for (auto& list : m_observers)
    {
        list.clear();
    }
}

void WidgetSignals::Emit(WidgetSignal signal, WidgetNode& sender) const
{
    if (signal == WidgetSignal::Count)
    {
        return;
    }
    // Observers may connect or disconnect while being notified.
    const std::vector<Observer> observers = m_observers[static_cast<std::size_t>(signal)];
    for (const Observer& observer : observers)
    {
        observer.callback(sender, signal);
    }
}
} // namespace canopy::ui

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <vector>

namespace canopy::ui
{
class WidgetNode;

enum class WidgetSignal : std::uint8_t
{
    Selected = 0,
    Focused,
    ContextMenu,
    Clicked,
    Count
};

// Observer list per signal kind. Emission is synchronous on the thread that
// owns the widget tree.
class WidgetSignals
{
public:
    using Callback = std::function<void(WidgetNode&, WidgetSignal)>;

    int Connect(WidgetSignal signal, Callback callback);
    bool Disconnect(int id);
    void DisconnectAll();
    void Emit(WidgetSignal signal, WidgetNode& sender) const;

    [[nodiscard]] std::size_t Count(WidgetSignal signal) const
    {
        return m_observers[static_cast<std::size_t>(signal)].size();
    }

private:
    struct Observer
    {
        int id = 0;
        Callback callback;
    };

    std::array<std::vector<Observer>, static_cast<std::size_t>(WidgetSignal::Count)> m_observers;
    int m_nextId = 1;
};
} // namespace canopy::ui

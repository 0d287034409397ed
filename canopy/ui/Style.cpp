#include "canopy/ui/Style.hpp"

namespace canopy::ui
{
void Style::Defaults()
{
    *this = Style{};
    outline.style = BorderDrawStyle::None;
    opacity = 1.0F;
    pointerEvents = true;
}

void Style::SetUnitContext(const UnitContext& base, const glm::vec2& viewport, const glm::vec2& element)
{
    units = base;
    units.viewport = viewport;
    units.element = element;
    // em is relative to this node's own font size.
    font.size.ToDots(units);
    if (font.size.dots > 0.0F)
    {
        units.fontEm = font.size.dots / units.dotsPerPx;
    }
    ToDots();
}

// font.size is converted by SetUnitContext against the base em.
void Style::ToDots()
{
    layout.width.ToDots(units, UnitAxis::Width);
    layout.minWidth.ToDots(units, UnitAxis::Width);
    layout.maxWidth.ToDots(units, UnitAxis::Width);
    layout.posX.ToDots(units, UnitAxis::Width);
    layout.height.ToDots(units, UnitAxis::Height);
    layout.minHeight.ToDots(units, UnitAxis::Height);
    layout.maxHeight.ToDots(units, UnitAxis::Height);
    layout.posY.ToDots(units, UnitAxis::Height);
    layout.margin.ToDots(units);

    border.width.ToDots(units);
    border.radius.ToDots(units);
    outline.width.ToDots(units);
    outline.radius.ToDots(units);
    padding.ToDots(units);

    shadow.hOffset.ToDots(units);
    shadow.vOffset.ToDots(units);
    shadow.blur.ToDots(units);
    shadow.spread.ToDots(units);
}
} // namespace canopy::ui

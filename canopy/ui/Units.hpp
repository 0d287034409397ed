#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <glm/vec2.hpp>

namespace canopy::ui
{
enum class Unit : std::uint8_t
{
    Px = 0,
    Dot,
    Pt,
    Pc,
    In,
    Cm,
    Mm,
    Em,
    Ex,
    Ch,
    Pct,
    Vw,
    Vh,
    Vmin,
    Vmax
};

enum class UnitAxis : std::uint8_t
{
    Width = 0,
    Height
};

// Everything needed to turn a length into device dots: pixel density, the
// current font size and the viewport and element (parent) sizes.
struct UnitContext
{
    float dotsPerPx = 1.0F;
    float fontEm = 16.0F;
    glm::vec2 viewport{0.0F, 0.0F};
    glm::vec2 element{0.0F, 0.0F};

    [[nodiscard]] float ToDots(float value, Unit unit, UnitAxis axis = UnitAxis::Width) const;
};

struct UnitValue
{
    float value = 0.0F;
    Unit unit = Unit::Px;
    float dots = 0.0F;

    [[nodiscard]] static UnitValue Px(float v) { return UnitValue{v, Unit::Px, v}; }
    [[nodiscard]] static UnitValue Pt(float v) { return UnitValue{v, Unit::Pt, 0.0F}; }
    [[nodiscard]] static UnitValue Em(float v) { return UnitValue{v, Unit::Em, 0.0F}; }
    [[nodiscard]] static UnitValue Pct(float v) { return UnitValue{v, Unit::Pct, 0.0F}; }

    void ToDots(const UnitContext& ctx, UnitAxis axis = UnitAxis::Width)
    {
        dots = ctx.ToDots(value, unit, axis);
    }

    bool operator==(const UnitValue& other) const
    {
        return value == other.value && unit == other.unit && dots == other.dots;
    }
    bool operator!=(const UnitValue& other) const
    {
        return !(*this == other);
    }
};

// Parses "12px", "50%", "1.5em", "-1". A bare number is px.
[[nodiscard]] std::optional<UnitValue> ParseUnitValue(std::string_view text);
[[nodiscard]] std::string_view UnitName(Unit unit);
} // namespace canopy::ui

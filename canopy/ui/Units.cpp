#include "canopy/ui/Units.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace canopy::ui
{
namespace
{
constexpr float kPxPerIn = 96.0F;

constexpr std::array<std::pair<std::string_view, Unit>, 15> kUnitNames{{
    {"px", Unit::Px},
    {"dot", Unit::Dot},
    {"pt", Unit::Pt},
    {"pc", Unit::Pc},
    {"in", Unit::In},
    {"cm", Unit::Cm},
    {"mm", Unit::Mm},
    {"em", Unit::Em},
    {"ex", Unit::Ex},
    {"ch", Unit::Ch},
    {"%", Unit::Pct},
    {"vw", Unit::Vw},
    {"vh", Unit::Vh},
    {"vmin", Unit::Vmin},
    {"vmax", Unit::Vmax},
}};

std::string_view Trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0)
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0)
    {
        text.remove_suffix(1);
    }
    return text;
}
} // namespace

float UnitContext::ToDots(float value, Unit unit, UnitAxis axis) const
{
    const float pxToDots = dotsPerPx;
    switch (unit)
    {
        case Unit::Px:
            return value * pxToDots;
        case Unit::Dot:
            return value;
        case Unit::Pt:
            return value * (kPxPerIn / 72.0F) * pxToDots;
        case Unit::Pc:
            return value * (kPxPerIn / 6.0F) * pxToDots;
        case Unit::In:
            return value * kPxPerIn * pxToDots;
        case Unit::Cm:
            return value * (kPxPerIn / 2.54F) * pxToDots;
        case Unit::Mm:
            return value * (kPxPerIn / 25.4F) * pxToDots;
        case Unit::Em:
            return value * fontEm * pxToDots;
        case Unit::Ex:
        case Unit::Ch:
            return value * 0.5F * fontEm * pxToDots;
        case Unit::Pct:
            return value * 0.01F * (axis == UnitAxis::Width ? element.x : element.y);
        case Unit::Vw:
            return value * 0.01F * viewport.x;
        case Unit::Vh:
            return value * 0.01F * viewport.y;
        case Unit::Vmin:
            return value * 0.01F * std::min(viewport.x, viewport.y);
        case Unit::Vmax:
            return value * 0.01F * std::max(viewport.x, viewport.y);
    }
    return value;
}

std::optional<UnitValue> ParseUnitValue(std::string_view text)
{
    text = Trim(text);
    if (text.empty())
    {
        return std::nullopt;
    }

    const std::string buffer(text);
    char* end = nullptr;
    const float number = std::strtof(buffer.c_str(), &end);
    if (end == buffer.c_str())
    {
        return std::nullopt;
    }

    std::string suffix(Trim(std::string_view(end)));
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (suffix.empty())
    {
        return UnitValue{number, Unit::Px, number};
    }
    for (const auto& [name, unit] : kUnitNames)
    {
        if (suffix == name)
        {
            return UnitValue{number, unit, 0.0F};
        }
    }
    return std::nullopt;
}

std::string_view UnitName(Unit unit)
{
    for (const auto& [name, u] : kUnitNames)
    {
        if (u == unit)
        {
            return name;
        }
    }
    return "px";
}
} // namespace canopy::ui

#pragma once

#include <cstdint>
#include <string>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "canopy/ui/Units.hpp"

namespace canopy::ui
{
enum class Display : std::uint8_t
{
    Inline = 0,
    Block,
    None
};

enum class BorderDrawStyle : std::uint8_t
{
    Solid = 0,
    Dotted,
    Dashed,
    Double,
    None
};

enum class FontWeight : std::uint8_t
{
    Normal = 0,
    Light,
    Bold
};

enum class FontSlant : std::uint8_t
{
    Normal = 0,
    Italic
};

enum class TextAlign : std::uint8_t
{
    Left = 0,
    Center,
    Right,
    Justify
};

enum class BoxAlign : std::uint8_t
{
    Start = 0,
    Center,
    End
};

struct BorderStyle
{
    BorderDrawStyle style = BorderDrawStyle::Solid;
    UnitValue width;
    UnitValue radius;
    glm::vec4 color{0.0F, 0.0F, 0.0F, 1.0F};
};

struct ShadowStyle
{
    UnitValue hOffset;
    UnitValue vOffset;
    UnitValue blur;
    UnitValue spread;
    glm::vec4 color{0.0F, 0.0F, 0.0F, 0.4F};
    bool inset = false;

    // Only positive offsets cast a shadow.
    [[nodiscard]] bool HasShadow() const
    {
        return hOffset.dots > 0.0F || vOffset.dots > 0.0F;
    }
};

struct FontStyle
{
    std::string family = "sans-serif";
    UnitValue size = UnitValue::Pt(12.0F);
    FontWeight weight = FontWeight::Normal;
    FontSlant slant = FontSlant::Normal;
    glm::vec4 backgroundColor{0.0F, 0.0F, 0.0F, 0.0F};
};

struct TextStyle
{
    TextAlign align = TextAlign::Left;
    bool wordWrap = false;
    float lineHeight = 1.0F;
};

struct LayoutStyle
{
    UnitValue width;
    UnitValue height;
    UnitValue minWidth;
    UnitValue minHeight;
    UnitValue maxWidth;
    UnitValue maxHeight;
    UnitValue posX;
    UnitValue posY;
    BoxAlign alignH = BoxAlign::Start;
    BoxAlign alignV = BoxAlign::Start;
    UnitValue margin;
};

// Resolved visual and layout properties for one node. Length fields hold
// device dots only after SetUnitContext has run for the current sizes.
struct Style
{
    bool resolved = false;
    Display display = Display::Inline;
    bool visible = true;
    bool inactive = false;
    bool pointerEvents = true;

    LayoutStyle layout;
    BorderStyle border;
    BorderStyle outline;
    ShadowStyle shadow;
    FontStyle font;
    TextStyle text;
    UnitValue padding;

    glm::vec4 color{0.0F, 0.0F, 0.0F, 1.0F};
    glm::vec4 background{0.0F, 0.0F, 0.0F, 0.0F};
    glm::vec4 fill{0.0F, 0.0F, 0.0F, 0.0F};
    glm::vec4 stroke{0.0F, 0.0F, 0.0F, 0.0F};
    float opacity = 1.0F;

    UnitContext units;

    void Defaults();

    // Rebuilds the unit context against the viewport and the element (parent)
    // size, then converts every length to dots.
    void SetUnitContext(const UnitContext& base, const glm::vec2& viewport, const glm::vec2& element);
    void ToDots();

    // Margin + border width + padding, in dots, on each side.
    [[nodiscard]] float BoxSpace() const
    {
        return layout.margin.dots + border.width.dots + padding.dots;
    }
};
} // namespace canopy::ui

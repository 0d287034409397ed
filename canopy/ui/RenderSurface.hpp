#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "canopy/ui/BBox.hpp"

namespace canopy::ui
{
enum class PaintKind : std::uint8_t
{
    None = 0,
    Solid,
    LinearGradient,
    ShadowGradient
};

struct Paint
{
    PaintKind kind = PaintKind::None;
    glm::vec4 color{0.0F};
    // Second stop for gradients; blur radius in x for shadows.
    glm::vec4 color2{0.0F};
    float blur = 0.0F;

    [[nodiscard]] static Paint Solid(const glm::vec4& c)
    {
        return Paint{c.a > 0.0F ? PaintKind::Solid : PaintKind::None, c, c, 0.0F};
    }
    [[nodiscard]] static Paint Gradient(const glm::vec4& top, const glm::vec4& bottom)
    {
        return Paint{PaintKind::LinearGradient, top, bottom, 0.0F};
    }
    [[nodiscard]] static Paint Shadow(const glm::vec4& c, float blurRadius)
    {
        return Paint{PaintKind::ShadowGradient, c, glm::vec4{c.r, c.g, c.b, 0.0F}, blurRadius};
    }

    [[nodiscard]] bool IsNone() const { return kind == PaintKind::None; }
};

// 2D drawing target. Clip bounds follow stack discipline: every PushBounds is
// matched by one PopBounds, and nested bounds intersect with the enclosing one.
class RenderSurface
{
public:
    virtual ~RenderSurface() = default;

    [[nodiscard]] virtual glm::ivec2 Size() const = 0;
    [[nodiscard]] BBox Bounds() const { return BBox{glm::ivec2{0, 0}, Size()}; }

    virtual void PushBounds(const BBox& bounds) = 0;
    virtual void PopBounds() = 0;

    virtual void FillRect(const glm::vec2& pos, const glm::vec2& size, const Paint& paint) = 0;
    virtual void StrokeRect(const glm::vec2& pos, const glm::vec2& size, float width, const Paint& paint) = 0;
    virtual void FillRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, const Paint& paint) = 0;
    virtual void StrokeRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, float width, const Paint& paint) = 0;
    virtual void DrawText(const glm::vec2& pos, std::string_view text, float fontSize, const glm::vec4& color) = 0;

    // Width of the widest line and total height. Surfaces with real glyph
    // metrics override this estimate.
    [[nodiscard]] virtual glm::vec2 MeasureText(std::string_view text, float fontSize) const;
};
} // namespace canopy::ui

#include "canopy/ui/RecordingSurface.hpp"

#include <algorithm>
#include <iostream>

namespace canopy::ui
{
void RecordingSurface::PushBounds(const BBox& bounds)
{
    const BBox clip = CurrentClip().Intersect(bounds);
    m_clipStack.push_back(clip);
    DrawCommand command;
    command.op = DrawOp::PushBounds;
    Record(std::move(command));
}

void RecordingSurface::PopBounds()
{
    if (m_clipStack.empty())
    {
        std::cerr << "[Render] PopBounds without matching PushBounds\n";
        return;
    }
    DrawCommand command;
    command.op = DrawOp::PopBounds;
    Record(std::move(command));
    m_clipStack.pop_back();
}

void RecordingSurface::FillRect(const glm::vec2& pos, const glm::vec2& size, const Paint& paint)
{
    Record(DrawCommand{DrawOp::FillRect, {}, pos, size, 0.0F, 0.0F, paint, {}});
}

void RecordingSurface::StrokeRect(const glm::vec2& pos, const glm::vec2& size, float width, const Paint& paint)
{
    Record(DrawCommand{DrawOp::StrokeRect, {}, pos, size, 0.0F, width, paint, {}});
}

void RecordingSurface::FillRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, const Paint& paint)
{
    Record(DrawCommand{DrawOp::FillRoundedRect, {}, pos, size, radius, 0.0F, paint, {}});
}

void RecordingSurface::StrokeRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, float width, const Paint& paint)
{
    Record(DrawCommand{DrawOp::StrokeRoundedRect, {}, pos, size, radius, width, paint, {}});
}

void RecordingSurface::DrawText(const glm::vec2& pos, std::string_view text, float fontSize, const glm::vec4& color)
{
    Record(DrawCommand{DrawOp::Text, {}, pos, glm::vec2{fontSize, fontSize}, 0.0F, 0.0F, Paint::Solid(color), std::string(text)});
}

std::size_t RecordingSurface::Count(DrawOp op) const
{
    return static_cast<std::size_t>(
        std::count_if(m_commands.begin(), m_commands.end(), [op](const DrawCommand& c) { return c.op == op; }));
}

bool RecordingSurface::HasText(std::string_view text) const
{
    return std::any_of(m_commands.begin(), m_commands.end(), [text](const DrawCommand& c) {
        return c.op == DrawOp::Text && c.text == text;
    });
}

void RecordingSurface::Clear()
{
    m_commands.clear();
    m_clipStack.clear();
}

BBox RecordingSurface::CurrentClip() const
{
    return m_clipStack.empty() ? Bounds() : m_clipStack.back();
}

void RecordingSurface::Record(DrawCommand command)
{
    command.clip = CurrentClip();
    m_commands.push_back(std::move(command));
}
} // namespace canopy::ui

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "canopy/ui/RenderSurface.hpp"

namespace canopy::ui
{
enum class DrawOp : std::uint8_t
{
    PushBounds = 0,
    PopBounds,
    FillRect,
    StrokeRect,
    FillRoundedRect,
    StrokeRoundedRect,
    Text
};

struct DrawCommand
{
    DrawOp op = DrawOp::FillRect;
    // Effective clip at the time of the call.
    BBox clip;
    glm::vec2 pos{0.0F};
    glm::vec2 size{0.0F};
    float radius = 0.0F;
    float width = 0.0F;
    Paint paint;
    std::string text;
};

// Headless surface that records every call. Used for tests and for frame
// dumps when render tracing is on.
class RecordingSurface final : public RenderSurface
{
public:
    explicit RecordingSurface(glm::ivec2 size) : m_size(size) {}

    [[nodiscard]] glm::ivec2 Size() const override { return m_size; }
    void Resize(glm::ivec2 size) { m_size = size; }

    void PushBounds(const BBox& bounds) override;
    void PopBounds() override;

    void FillRect(const glm::vec2& pos, const glm::vec2& size, const Paint& paint) override;
    void StrokeRect(const glm::vec2& pos, const glm::vec2& size, float width, const Paint& paint) override;
    void FillRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, const Paint& paint) override;
    void StrokeRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, float width, const Paint& paint) override;
    void DrawText(const glm::vec2& pos, std::string_view text, float fontSize, const glm::vec4& color) override;

    [[nodiscard]] const std::vector<DrawCommand>& Commands() const { return m_commands; }
    [[nodiscard]] std::size_t ClipDepth() const { return m_clipStack.size(); }
    [[nodiscard]] std::size_t Count(DrawOp op) const;
    [[nodiscard]] bool HasText(std::string_view text) const;
    void Clear();

private:
    [[nodiscard]] BBox CurrentClip() const;
    void Record(DrawCommand command);

    glm::ivec2 m_size{0, 0};
    std::vector<BBox> m_clipStack;
    std::vector<DrawCommand> m_commands;
};
} // namespace canopy::ui

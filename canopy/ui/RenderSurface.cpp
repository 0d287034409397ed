#include "canopy/ui/RenderSurface.hpp"

namespace canopy::ui
{
glm::vec2 RenderSurface::MeasureText(std::string_view text, float fontSize) const
{
    if (text.empty())
    {
        return glm::vec2{0.0F, 0.0F};
    }
    const float size = std::max(6.0F, fontSize);
    const float charWidth = size * 0.6F;
    float maxWidth = 0.0F;
    int lines = 0;
    std::size_t lineStart = 0;
    while (lineStart <= text.size())
    {
        const std::size_t lineEnd = text.find('\n', lineStart);
        const std::size_t glyphs = (lineEnd == std::string_view::npos) ? (text.size() - lineStart) : (lineEnd - lineStart);
        maxWidth = std::max(maxWidth, static_cast<float>(glyphs) * charWidth);
        ++lines;
        if (lineEnd == std::string_view::npos)
        {
            break;
        }
        lineStart = lineEnd + 1;
    }
    return glm::vec2{std::max(1.0F, maxWidth), size * 1.4F * static_cast<float>(lines)};
}
} // namespace canopy::ui

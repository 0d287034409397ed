#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>

namespace canopy::ui
{
// Printable ASCII baked once, at a reference pixel height, into a single
// channel bitmap. Other font sizes scale the baked metrics.
class GlyphAtlas
{
public:
    struct GlyphQuad
    {
        glm::vec2 min{0.0F};
        glm::vec2 max{0.0F};
        glm::vec2 uvMin{0.0F};
        glm::vec2 uvMax{0.0F};
    };

    // Tries `requested`, then the usual system font locations.
    bool LoadFirstAvailable(const std::string& requested, std::string* outLoadedPath = nullptr);
    bool Bake(const std::vector<unsigned char>& ttf, std::string* outError = nullptr);
    void Clear();

    [[nodiscard]] bool Empty() const { return m_glyphs.empty(); }
    [[nodiscard]] const glm::ivec2& Size() const { return m_size; }
    [[nodiscard]] const std::vector<unsigned char>& Bitmap() const { return m_bitmap; }
    // The bitmap is only needed until it is uploaded.
    void ReleaseBitmap() { m_bitmap = {}; }

    // Calls `emit(const GlyphQuad&)` for every drawable glyph of `text`, with
    // the first line's top at `origin.y`.
    template <typename Emit>
    void Layout(std::string_view text, float fontSize, const glm::vec2& origin, Emit&& emit) const;
    [[nodiscard]] glm::vec2 Measure(std::string_view text, float fontSize) const;

private:
    struct Glyph
    {
        glm::vec2 offset{0.0F};
        glm::vec2 extent{0.0F};
        glm::vec2 uvMin{0.0F};
        glm::vec2 uvMax{0.0F};
        float advance = 0.0F;
    };

    static constexpr char kFirst = 32;
    static constexpr int kCount = 95;
    static constexpr float kMissingAdvance = 6.0F;

    [[nodiscard]] const Glyph* Find(char ch) const
    {
        const int idx = static_cast<int>(ch) - kFirst;
        return idx >= 0 && idx < kCount ? &m_glyphs[static_cast<std::size_t>(idx)] : nullptr;
    }
    [[nodiscard]] float Scale(float fontSize) const { return (fontSize < 1.0F ? 1.0F : fontSize) / m_pixelHeight; }

    std::vector<Glyph> m_glyphs;
    std::vector<unsigned char> m_bitmap;
    glm::ivec2 m_size{512, 512};
    float m_pixelHeight = 32.0F;
    float m_ascent = 0.0F;
    float m_lineHeight = 32.0F;
};

template <typename Emit>
void GlyphAtlas::Layout(std::string_view text, float fontSize, const glm::vec2& origin, Emit&& emit) const
{
    const float s = Scale(fontSize);
    glm::vec2 pen{origin.x, origin.y + m_ascent * s};
    for (const char ch : text)
    {
        if (ch == '\n')
        {
            pen = glm::vec2{origin.x, pen.y + m_lineHeight * s};
            continue;
        }
        const Glyph* glyph = Find(ch);
        if (glyph == nullptr)
        {
            pen.x += kMissingAdvance * s;
            continue;
        }
        if (glyph->extent.x > 0.0F && glyph->extent.y > 0.0F)
        {
            const glm::vec2 min = pen + glyph->offset * s;
            emit(GlyphQuad{min, min + glyph->extent * s, glyph->uvMin, glyph->uvMax});
        }
        pen.x += glyph->advance * s;
    }
}
} // namespace canopy::ui

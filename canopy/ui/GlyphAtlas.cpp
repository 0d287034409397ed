#include "canopy/ui/GlyphAtlas.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <iostream>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace canopy::ui
{
namespace
{
constexpr std::array<const char*, 4> kSystemFonts = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
};

bool ReadFontFile(const std::string& path, std::vector<unsigned char>& outData)
{
    std::ifstream stream(path, std::ios::binary | std::ios::ate);
    if (!stream)
    {
        return false;
    }
    const std::streamsize length = stream.tellg();
    if (length <= 0)
    {
        return false;
    }
    outData.resize(static_cast<std::size_t>(length));
    stream.seekg(0);
    return static_cast<bool>(stream.read(reinterpret_cast<char*>(outData.data()), length));
}
} // namespace

bool GlyphAtlas::LoadFirstAvailable(const std::string& requested, std::string* outLoadedPath)
{
    std::vector<std::string> paths;
    if (!requested.empty())
    {
        paths.push_back(requested);
    }
    paths.insert(paths.end(), kSystemFonts.begin(), kSystemFonts.end());

    std::vector<unsigned char> ttf;
    for (const std::string& path : paths)
    {
        if (!ReadFontFile(path, ttf))
        {
            continue;
        }
        std::string error;
        if (!Bake(ttf, &error))
        {
            std::cerr << "[Render] " << path << ": " << error << "\n";
            continue;
        }
        if (outLoadedPath != nullptr)
        {
            *outLoadedPath = path;
        }
        return true;
    }
    return false;
}

bool GlyphAtlas::Bake(const std::vector<unsigned char>& ttf, std::string* outError)
{
    Clear();
    const int fontOffset = stbtt_GetFontOffsetForIndex(ttf.data(), 0);
    stbtt_fontinfo info;
    if (fontOffset < 0 || stbtt_InitFont(&info, ttf.data(), fontOffset) == 0)
    {
        if (outError != nullptr)
        {
            *outError = "not a TrueType font";
        }
        return false;
    }

    m_bitmap.assign(static_cast<std::size_t>(m_size.x) * static_cast<std::size_t>(m_size.y), 0);
    std::array<stbtt_bakedchar, kCount> baked{};
    const int rows = stbtt_BakeFontBitmap(ttf.data(), fontOffset, m_pixelHeight, m_bitmap.data(), m_size.x, m_size.y, kFirst, kCount,
        baked.data());
    if (rows <= 0)
    {
        if (outError != nullptr)
        {
            *outError = "only " + std::to_string(-rows) + " of " + std::to_string(kCount) + " glyphs fit the atlas";
        }
        m_bitmap.clear();
        return false;
    }

    int ascent = 0;
    int descent = 0;
    int lineGap = 0;
    stbtt_GetFontVMetrics(&info, &ascent, &descent, &lineGap);
    const float scale = stbtt_ScaleForPixelHeight(&info, m_pixelHeight);
    m_ascent = std::round(static_cast<float>(ascent) * scale);
    m_lineHeight = std::max(1.0F, std::round(static_cast<float>(ascent - descent + lineGap) * scale));

    const glm::vec2 texel = 1.0F / glm::vec2(m_size);
    m_glyphs.reserve(kCount);
    for (const stbtt_bakedchar& src : baked)
    {
        Glyph glyph;
        glyph.offset = glm::vec2{src.xoff, src.yoff};
        glyph.extent = glm::vec2{static_cast<float>(src.x1 - src.x0), static_cast<float>(src.y1 - src.y0)};
        glyph.uvMin = glm::vec2{static_cast<float>(src.x0), static_cast<float>(src.y0)} * texel;
        glyph.uvMax = glm::vec2{static_cast<float>(src.x1), static_cast<float>(src.y1)} * texel;
        glyph.advance = src.xadvance;
        m_glyphs.push_back(glyph);
    }
    return true;
}

void GlyphAtlas::Clear()
{
    m_glyphs.clear();
    m_bitmap.clear();
}

glm::vec2 GlyphAtlas::Measure(std::string_view text, float fontSize) const
{
    const float s = Scale(fontSize);
    float lineWidth = 0.0F;
    float width = 0.0F;
    int lines = text.empty() ? 0 : 1;
    for (const char ch : text)
    {
        if (ch == '\n')
        {
            width = std::max(width, lineWidth);
            lineWidth = 0.0F;
            ++lines;
            continue;
        }
        const Glyph* glyph = Find(ch);
        lineWidth += (glyph != nullptr ? glyph->advance : kMissingAdvance) * s;
    }
    width = std::max(width, lineWidth);
    return glm::vec2{std::ceil(width), std::ceil(m_lineHeight * s * static_cast<float>(lines))};
}
} // namespace canopy::ui

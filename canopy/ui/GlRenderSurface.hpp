#pragma once

#include <memory>
#include <string>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "canopy/gpu/GlGpu.hpp"
#include "canopy/ui/GlyphAtlas.hpp"
#include "canopy/ui/RenderSurface.hpp"

namespace canopy::ui
{
// Batches quads per clip rectangle and draws them at EndFrame with one
// buffer upload. Rounded boxes, strokes and shadows are shaded with a
// signed distance in the fragment shader; text uses a baked glyph atlas.
class GlRenderSurface final : public RenderSurface
{
public:
    GlRenderSurface() = default;
    ~GlRenderSurface() override = default;

    GlRenderSurface(const GlRenderSurface&) = delete;
    GlRenderSurface& operator=(const GlRenderSurface&) = delete;

    // Requires a current GL context. Falls back to system fonts when
    // `fontPath` cannot be loaded; without any font, text is skipped.
    bool Initialize(const std::string& fontPath, std::string* outError = nullptr);
    // Must run while the context is still current.
    void Shutdown();

    void BeginFrame(const glm::ivec2& framebufferSize);
    void EndFrame();

    [[nodiscard]] glm::ivec2 Size() const override { return m_size; }
    [[nodiscard]] bool HasFont() const { return !m_atlas.Empty(); }

    void PushBounds(const BBox& bounds) override;
    void PopBounds() override;

    void FillRect(const glm::vec2& pos, const glm::vec2& size, const Paint& paint) override;
    void StrokeRect(const glm::vec2& pos, const glm::vec2& size, float width, const Paint& paint) override;
    void FillRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, const Paint& paint) override;
    void StrokeRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, float width, const Paint& paint) override;
    void DrawText(const glm::vec2& pos, std::string_view text, float fontSize, const glm::vec4& color) override;

    [[nodiscard]] glm::vec2 MeasureText(std::string_view text, float fontSize) const override;

private:
    enum class QuadMode : int
    {
        Solid = 0,
        Text = 1,
        RoundFill = 2,
        RoundStroke = 3,
        Shadow = 4
    };

    struct QuadVertex
    {
        float x = 0.0F;
        float y = 0.0F;
        float u = 0.0F;
        float v = 0.0F;
        float r = 1.0F;
        float g = 1.0F;
        float b = 1.0F;
        float a = 1.0F;
        float mode = 0.0F;
        // Half size, corner radius and stroke width or blur.
        float halfW = 0.0F;
        float halfH = 0.0F;
        float radius = 0.0F;
        float param = 0.0F;
    };

    struct DrawBatch
    {
        BBox clip;
        std::vector<QuadVertex> vertices;
    };

    void UploadAtlas();
    [[nodiscard]] BBox CurrentClip() const;
    DrawBatch& ActiveBatch();
    // Emits a shaded quad. `top` and `bottom` colors make vertical gradients.
    void EmitShape(const glm::vec2& pos, const glm::vec2& size, const glm::vec4& top, const glm::vec4& bottom, QuadMode mode,
        float radius, float param, float grow);
    void EmitGlyph(const GlyphAtlas::GlyphQuad& quad, const glm::vec4& color);
    void EmitPaint(const glm::vec2& pos, const glm::vec2& size, float radius, float strokeWidth, const Paint& paint, bool stroke);

    glm::ivec2 m_size{1, 1};
    std::vector<BBox> m_clipStack;
    std::vector<DrawBatch> m_batches;

    std::unique_ptr<gpu::GlProgram> m_program;
    unsigned int m_vbo = 0;
    unsigned int m_vao = 0;
    unsigned int m_fontTexture = 0;

    GlyphAtlas m_atlas;
};
} // namespace canopy::ui

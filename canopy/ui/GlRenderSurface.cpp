#include "canopy/ui/GlRenderSurface.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>

#include <glad/glad.h>
#include <glm/common.hpp>

namespace canopy::ui
{
namespace
{
constexpr const char* kSurfaceVertexShader = R"(
#version 450 core
layout(location = 0) in vec2 aPos;
layout(location = 1) in vec2 aUv;
layout(location = 2) in vec4 aColor;
layout(location = 3) in float aMode;
layout(location = 4) in vec4 aShape;
uniform vec2 uScreenSize;
out vec2 vUv;
out vec4 vColor;
flat out float vMode;
flat out vec4 vShape;
void main() {
    vec2 ndc = vec2((aPos.x / uScreenSize.x) * 2.0 - 1.0, 1.0 - (aPos.y / uScreenSize.y) * 2.0);
    gl_Position = vec4(ndc, 0.0, 1.0);
    vUv = aUv;
    vColor = aColor;
    vMode = aMode;
    vShape = aShape;
}
)";

// Modes: 0 solid, 1 glyph, 2 rounded fill, 3 rounded stroke, 4 shadow.
// For modes 2-4 vUv is the offset from the box center.
constexpr const char* kSurfaceFragmentShader = R"(
#version 450 core
in vec2 vUv;
in vec4 vColor;
flat in float vMode;
flat in vec4 vShape;
uniform sampler2D uFontTexture;
out vec4 FragColor;
float RoundBoxDistance(vec2 p, vec2 halfSize, float radius) {
    vec2 q = abs(p) - halfSize + vec2(radius);
    return length(max(q, 0.0)) + min(max(q.x, q.y), 0.0) - radius;
}
void main() {
    int mode = int(vMode + 0.5);
    if (mode == 1) {
        FragColor = vec4(vColor.rgb, vColor.a * texture(uFontTexture, vUv).r);
        return;
    }
    if (mode == 0) {
        FragColor = vColor;
        return;
    }
    float d = RoundBoxDistance(vUv, vShape.xy, vShape.z);
    float coverage = 0.0;
    if (mode == 2) {
        coverage = clamp(0.5 - d, 0.0, 1.0);
    } else if (mode == 3) {
        coverage = clamp(0.5 - (abs(d) - vShape.w * 0.5), 0.0, 1.0);
    } else {
        float blur = max(vShape.w, 1.0);
        coverage = 1.0 - smoothstep(-blur, blur, d);
    }
    FragColor = vec4(vColor.rgb, vColor.a * coverage);
}
)";

void EnableFloatAttrib(unsigned int index, int components, std::size_t stride, std::size_t offset)
{
    glVertexAttribPointer(index, components, GL_FLOAT, GL_FALSE, static_cast<GLsizei>(stride), reinterpret_cast<void*>(offset));
    glEnableVertexAttribArray(index);
}
} // namespace

bool GlRenderSurface::Initialize(const std::string& fontPath, std::string* outError)
{
    m_program = std::make_unique<gpu::GlProgram>("surface");
    m_program->AddShader(gpu::ShaderType::Vertex, kSurfaceVertexShader);
    m_program->AddShader(gpu::ShaderType::Fragment, kSurfaceFragmentShader);
    m_program->AddUniform("uScreenSize");
    m_program->AddUniform("uFontTexture");
    if (!m_program->Compile(outError))
    {
        m_program.reset();
        return false;
    }
    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, 4 * 1024 * 1024, nullptr, GL_DYNAMIC_DRAW);
    constexpr std::size_t stride = sizeof(QuadVertex);
    EnableFloatAttrib(0, 2, stride, offsetof(QuadVertex, x));
    EnableFloatAttrib(1, 2, stride, offsetof(QuadVertex, u));
    EnableFloatAttrib(2, 4, stride, offsetof(QuadVertex, r));
    EnableFloatAttrib(3, 1, stride, offsetof(QuadVertex, mode));
    EnableFloatAttrib(4, 4, stride, offsetof(QuadVertex, halfW));
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    std::string loadedPath;
    if (m_atlas.LoadFirstAvailable(fontPath, &loadedPath))
    {
        UploadAtlas();
        std::cout << "[Render] Loaded font " << loadedPath << " into a " << m_atlas.Size().x << "x" << m_atlas.Size().y << " atlas\n";
    }
    else
    {
        std::cerr << "[Render] No usable font found; text will not be drawn\n";
    }
    return true;
}

void GlRenderSurface::Shutdown()
{
    if (m_fontTexture != 0)
    {
        glDeleteTextures(1, &m_fontTexture);
        m_fontTexture = 0;
    }
    if (m_vbo != 0)
    {
        glDeleteBuffers(1, &m_vbo);
        m_vbo = 0;
    }
    if (m_vao != 0)
    {
        glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }
    m_program.reset();
    m_atlas.Clear();
}

void GlRenderSurface::UploadAtlas()
{
    if (m_fontTexture == 0)
    {
        glGenTextures(1, &m_fontTexture);
    }
    const glm::ivec2& size = m_atlas.Size();
    glBindTexture(GL_TEXTURE_2D, m_fontTexture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, size.x, size.y, 0, GL_RED, GL_UNSIGNED_BYTE, m_atlas.Bitmap().data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);
    m_atlas.ReleaseBitmap();
}

void GlRenderSurface::BeginFrame(const glm::ivec2& framebufferSize)
{
    m_size = glm::max(framebufferSize, glm::ivec2{1, 1});
    m_clipStack.clear();
    m_batches.clear();
    m_batches.reserve(64);
}

void GlRenderSurface::EndFrame()
{
    if (!m_clipStack.empty())
    {
        std::cerr << "[Render] " << m_clipStack.size() << " unbalanced PushBounds at end of frame\n";
        m_clipStack.clear();
    }
    if (!m_program)
    {
        m_batches.clear();
        return;
    }

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDisable(GL_DEPTH_TEST);

    m_program->Activate();
    m_program->SetUniform("uScreenSize", glm::vec2(m_size));
    m_program->SetUniform("uFontTexture", 0);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_fontTexture);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);

    std::size_t totalVertices = 0;
    for (const DrawBatch& batch : m_batches)
    {
        totalVertices += batch.vertices.size();
    }
    if (totalVertices > 0)
    {
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(totalVertices * sizeof(QuadVertex)), nullptr, GL_DYNAMIC_DRAW);
        GLintptr offset = 0;
        for (const DrawBatch& batch : m_batches)
        {
            if (!batch.vertices.empty())
            {
                const auto bytes = static_cast<GLsizeiptr>(batch.vertices.size() * sizeof(QuadVertex));
                glBufferSubData(GL_ARRAY_BUFFER, offset, bytes, batch.vertices.data());
                offset += bytes;
            }
        }

        glEnable(GL_SCISSOR_TEST);
        GLint vertexOffset = 0;
        for (const DrawBatch& batch : m_batches)
        {
            if (batch.vertices.empty())
            {
                continue;
            }
            const glm::ivec2 size = batch.clip.Size();
            glScissor(batch.clip.min.x, std::max(0, m_size.y - batch.clip.max.y), size.x, size.y);
            glDrawArrays(GL_TRIANGLES, vertexOffset, static_cast<GLsizei>(batch.vertices.size()));
            vertexOffset += static_cast<GLint>(batch.vertices.size());
        }
    }

    glDisable(GL_SCISSOR_TEST);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
    glEnable(GL_DEPTH_TEST);
}

void GlRenderSurface::PushBounds(const BBox& bounds)
{
    m_clipStack.push_back(CurrentClip().Intersect(bounds));
}

void GlRenderSurface::PopBounds()
{
    if (!m_clipStack.empty())
    {
        m_clipStack.pop_back();
    }
}

BBox GlRenderSurface::CurrentClip() const
{
    return m_clipStack.empty() ? Bounds() : m_clipStack.back();
}

GlRenderSurface::DrawBatch& GlRenderSurface::ActiveBatch()
{
    const BBox clip = CurrentClip();
    if (m_batches.empty() || m_batches.back().clip != clip)
    {
        m_batches.push_back(DrawBatch{clip, {}});
        m_batches.back().vertices.reserve(1024);
    }
    return m_batches.back();
}

void GlRenderSurface::EmitShape(const glm::vec2& pos, const glm::vec2& size, const glm::vec4& top, const glm::vec4& bottom,
    QuadMode mode, float radius, float param, float grow)
{
    if (CurrentClip().Empty())
    {
        return;
    }
    DrawBatch& batch = ActiveBatch();
    const glm::vec2 half = size * 0.5F;
    const glm::vec2 center = pos + half;
    const float r = std::min(radius, std::min(half.x, half.y));
    const float m = static_cast<float>(mode);
    const glm::vec2 lo = pos - grow;
    const glm::vec2 hi = pos + size + grow;
    auto push = [&](float x, float y, const glm::vec4& c) {
        batch.vertices.push_back(QuadVertex{x, y, x - center.x, y - center.y, c.r, c.g, c.b, c.a, m, half.x, half.y, r, param});
    };
    push(lo.x, lo.y, top);
    push(hi.x, lo.y, top);
    push(hi.x, hi.y, bottom);
    push(lo.x, lo.y, top);
    push(hi.x, hi.y, bottom);
    push(lo.x, hi.y, bottom);
}

void GlRenderSurface::EmitGlyph(const GlyphAtlas::GlyphQuad& quad, const glm::vec4& color)
{
    DrawBatch& batch = ActiveBatch();
    const float m = static_cast<float>(QuadMode::Text);
    const auto corner = [&](bool right, bool bottom) {
        const float x = right ? quad.max.x : quad.min.x;
        const float y = bottom ? quad.max.y : quad.min.y;
        const float u = right ? quad.uvMax.x : quad.uvMin.x;
        const float v = bottom ? quad.uvMax.y : quad.uvMin.y;
        batch.vertices.push_back(QuadVertex{x, y, u, v, color.r, color.g, color.b, color.a, m, 0.0F, 0.0F, 0.0F, 0.0F});
    };
    corner(false, false);
    corner(true, false);
    corner(true, true);
    corner(false, false);
    corner(true, true);
    corner(false, true);
}

void GlRenderSurface::EmitPaint(const glm::vec2& pos, const glm::vec2& size, float radius, float strokeWidth, const Paint& paint, bool stroke)
{
    if (paint.IsNone() || size.x <= 0.0F || size.y <= 0.0F)
    {
        return;
    }
    switch (paint.kind)
    {
        case PaintKind::ShadowGradient:
            EmitShape(pos, size, paint.color, paint.color, QuadMode::Shadow, radius, paint.blur, paint.blur);
            break;
        case PaintKind::LinearGradient:
            EmitShape(pos, size, paint.color, paint.color2, stroke ? QuadMode::RoundStroke : QuadMode::RoundFill, radius, strokeWidth,
                stroke ? strokeWidth * 0.5F : 0.0F);
            break;
        default:
            if (!stroke && radius <= 0.0F)
            {
                EmitShape(pos, size, paint.color, paint.color, QuadMode::Solid, 0.0F, 0.0F, 0.0F);
            }
            else
            {
                EmitShape(pos, size, paint.color, paint.color, stroke ? QuadMode::RoundStroke : QuadMode::RoundFill, radius,
                    strokeWidth, stroke ? strokeWidth * 0.5F : 0.0F);
            }
            break;
    }
}

void GlRenderSurface::FillRect(const glm::vec2& pos, const glm::vec2& size, const Paint& paint)
{
    EmitPaint(pos, size, 0.0F, 0.0F, paint, false);
}

void GlRenderSurface::StrokeRect(const glm::vec2& pos, const glm::vec2& size, float width, const Paint& paint)
{
    EmitPaint(pos, size, 0.0F, width, paint, true);
}

void GlRenderSurface::FillRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, const Paint& paint)
{
    EmitPaint(pos, size, radius, 0.0F, paint, false);
}

void GlRenderSurface::StrokeRoundedRect(const glm::vec2& pos, const glm::vec2& size, float radius, float width, const Paint& paint)
{
    EmitPaint(pos, size, radius, width, paint, true);
}

void GlRenderSurface::DrawText(const glm::vec2& pos, std::string_view text, float fontSize, const glm::vec4& color)
{
    if (m_atlas.Empty() || CurrentClip().Empty())
    {
        return;
    }
    m_atlas.Layout(text, fontSize, pos, [this, &color](const GlyphAtlas::GlyphQuad& quad) { EmitGlyph(quad, color); });
}

glm::vec2 GlRenderSurface::MeasureText(std::string_view text, float fontSize) const
{
    return m_atlas.Empty() ? RenderSurface::MeasureText(text, fontSize) : m_atlas.Measure(text, fontSize);
}
} // namespace canopy::ui

#pragma once

#include <string>
#include <unordered_map>

#include "canopy/gpu/Gpu.hpp"

namespace canopy::gpu
{
class GlProgram final : public Program
{
public:
    explicit GlProgram(std::string name) : Program(std::move(name)) {}
    ~GlProgram() override;

    [[nodiscard]] bool Compile(std::string* outError) override;
    void Activate() override;
    void SetUniform(const std::string& name, const UniformValue& value) override;

private:
    unsigned int m_handle = 0;
    std::unordered_map<std::string, int> m_uniformLocations;
};

class GlVectorsBuffer final : public VectorsBuffer
{
public:
    explicit GlVectorsBuffer(BufferUsage usage);
    ~GlVectorsBuffer() override;

    void Activate() override;
    void Transfer() override;

private:
    void ApplyLayout();

    unsigned int m_vbo = 0;
    std::size_t m_capacityBytes = 0;
};

class GlIndexesBuffer final : public IndexesBuffer
{
public:
    explicit GlIndexesBuffer(BufferUsage usage);
    ~GlIndexesBuffer() override;

    void Activate() override;
    void Transfer() override;

private:
    unsigned int m_ebo = 0;
};

class GlBufferMgr final : public BufferMgr
{
public:
    GlBufferMgr();
    ~GlBufferMgr() override;

    void Activate() override;

protected:
    [[nodiscard]] std::unique_ptr<VectorsBuffer> CreateVectorsBuffer(BufferUsage usage) override;
    [[nodiscard]] std::unique_ptr<IndexesBuffer> CreateIndexesBuffer(BufferUsage usage) override;

private:
    unsigned int m_vao = 0;
};

// OpenGL 4.5 core backend. All calls require the window's context to be
// current on the calling thread.
class GlGpu final : public Gpu
{
public:
    [[nodiscard]] std::unique_ptr<Program> NewProgram(const std::string& name) override;
    [[nodiscard]] std::unique_ptr<BufferMgr> NewBufferMgr() override;
    void TrianglesIndexed(std::size_t start, std::size_t count) override;
};
} // namespace canopy::gpu

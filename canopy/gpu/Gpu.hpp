#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

namespace canopy::gpu
{
enum class BufferUsage : std::uint8_t
{
    StaticDraw = 0,
    DynamicDraw,
    StreamDraw
};

enum class ShaderType : std::uint8_t
{
    Vertex = 0,
    Fragment
};

enum class VectorRole : std::uint8_t
{
    Position = 0,
    Normal,
    TexCoord,
    Color
};

// Vertex input declared on a program. Buffers refer to inputs by this
// descriptor, so a mesh never needs to know attribute locations.
struct VectorsDesc
{
    std::string name;
    VectorRole role = VectorRole::Position;
    int components = 3;
    int location = 0;
};

using UniformValue = std::variant<int, float, glm::vec2, glm::vec3, glm::vec4, glm::mat4>;

class Program
{
public:
    explicit Program(std::string name) : m_name(std::move(name)) {}
    virtual ~Program() = default;

    Program(const Program&) = delete;
    Program& operator=(const Program&) = delete;

    void AddShader(ShaderType type, std::string source);
    void AddUniform(const std::string& name);
    const VectorsDesc& AddInput(const std::string& name, VectorRole role, int components, int location);

    [[nodiscard]] virtual bool Compile(std::string* outError) = 0;
    virtual void Activate() = 0;
    virtual void SetUniform(const std::string& name, const UniformValue& value) = 0;

    [[nodiscard]] const std::string& Name() const { return m_name; }
    [[nodiscard]] const std::vector<std::unique_ptr<VectorsDesc>>& Inputs() const { return m_inputs; }
    [[nodiscard]] const std::vector<std::string>& Uniforms() const { return m_uniforms; }

protected:
    struct ShaderSource
    {
        ShaderType type = ShaderType::Vertex;
        std::string source;
    };

    std::string m_name;
    std::vector<ShaderSource> m_shaders;
    std::vector<std::string> m_uniforms;
    std::vector<std::unique_ptr<VectorsDesc>> m_inputs;
};

// CPU-side staging for one vertex buffer. Interleaved vectors share one
// stride; non-interleaved vectors are appended after the interleaved block.
class VectorsBuffer
{
public:
    explicit VectorsBuffer(BufferUsage usage) : m_usage(usage) {}
    virtual ~VectorsBuffer() = default;

    [[nodiscard]] BufferUsage Usage() const { return m_usage; }
    [[nodiscard]] int NumVectors() const { return static_cast<int>(m_vectors.size()); }

    void AddVectors(const VectorsDesc& desc, bool interleave);
    void DeleteAllVectors();

    // Resizes every vector to `len` elements. Existing contents are kept up
    // to the new length.
    void SetLen(std::size_t len);
    [[nodiscard]] std::size_t Len() const { return m_len; }

    // Copies data into the staging array for `desc`. Never resizes: at most
    // Len() elements are copied and a shorter source leaves the tail as is.
    void SetVecData(const VectorsDesc& desc, const std::vector<float>& data);
    [[nodiscard]] const std::vector<float>* VecData(const VectorsDesc& desc) const;

    [[nodiscard]] std::vector<float> AllData() const;
    [[nodiscard]] int Stride() const;
    [[nodiscard]] std::size_t Offset(const VectorsDesc& desc) const;
    [[nodiscard]] bool IsInterleaved(const VectorsDesc& desc) const;

    virtual void Activate() = 0;
    virtual void Transfer() = 0;

protected:
    struct Entry
    {
        const VectorsDesc* desc = nullptr;
        bool interleave = true;
        std::vector<float> data;
    };

    [[nodiscard]] const std::vector<Entry>& Entries() const { return m_vectors; }
    [[nodiscard]] bool LayoutChanged() const { return m_layoutChanged; }
    void ClearLayoutChanged() { m_layoutChanged = false; }

private:
    [[nodiscard]] Entry* FindEntry(const VectorsDesc& desc);
    [[nodiscard]] const Entry* FindEntry(const VectorsDesc& desc) const;

    BufferUsage m_usage = BufferUsage::StaticDraw;
    std::vector<Entry> m_vectors;
    std::size_t m_len = 0;
    bool m_layoutChanged = true;
};

class IndexesBuffer
{
public:
    explicit IndexesBuffer(BufferUsage usage) : m_usage(usage) {}
    virtual ~IndexesBuffer() = default;

    [[nodiscard]] BufferUsage Usage() const { return m_usage; }

    void SetLen(std::size_t len) { m_indexes.resize(len); }
    [[nodiscard]] std::size_t Len() const { return m_indexes.size(); }
    void Set(const std::vector<std::uint32_t>& indexes);
    [[nodiscard]] const std::vector<std::uint32_t>& Data() const { return m_indexes; }

    virtual void Activate() = 0;
    virtual void Transfer() = 0;

private:
    BufferUsage m_usage = BufferUsage::StaticDraw;
    std::vector<std::uint32_t> m_indexes;
};

// Owns the vertex and index buffers of one mesh.
class BufferMgr
{
public:
    virtual ~BufferMgr() = default;

    VectorsBuffer* AddVectorsBuffer(BufferUsage usage);
    IndexesBuffer* AddIndexesBuffer(BufferUsage usage);

    [[nodiscard]] VectorsBuffer* Vectors() { return m_vectors.get(); }
    [[nodiscard]] IndexesBuffer* Indexes() { return m_indexes.get(); }

    virtual void Activate() = 0;
    void TransferAll();
    void TransferVectors();
    void TransferIndexes();

protected:
    [[nodiscard]] virtual std::unique_ptr<VectorsBuffer> CreateVectorsBuffer(BufferUsage usage) = 0;
    [[nodiscard]] virtual std::unique_ptr<IndexesBuffer> CreateIndexesBuffer(BufferUsage usage) = 0;

    std::unique_ptr<VectorsBuffer> m_vectors;
    std::unique_ptr<IndexesBuffer> m_indexes;
};

class Gpu
{
public:
    virtual ~Gpu() = default;

    [[nodiscard]] virtual std::unique_ptr<Program> NewProgram(const std::string& name) = 0;
    [[nodiscard]] virtual std::unique_ptr<BufferMgr> NewBufferMgr() = 0;

    // Draws `count` indices starting at `start` from the active index buffer.
    virtual void TrianglesIndexed(std::size_t start, std::size_t count) = 0;
};
} // namespace canopy::gpu

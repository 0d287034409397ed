#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "canopy/gpu/Gpu.hpp"

namespace canopy::scene
{
class Scene;

enum class MeshStatus : std::uint8_t
{
    Ok = 0,
    ShapeInvalid,
    ContextInactive
};

enum class Axis : std::uint8_t
{
    X = 0,
    Y,
    Z
};

struct MeshBBox
{
    glm::vec3 min{0.0F};
    glm::vec3 max{0.0F};
};

// Parameters shared by AddPlane and SetPlaneVtx.
struct PlaneParams
{
    Axis waxis = Axis::X;
    Axis haxis = Axis::Y;
    int wdir = 1;
    int hdir = 1;
    float width = 1.0F;
    float height = 1.0F;
    float woff = 0.0F;
    float hoff = 0.0F;
    float zoff = 0.0F;
    int wsegs = 1;
    int hsegs = 1;
    bool hasColor = false;
    glm::vec4 color{1.0F};
};

// Indexed triangle mesh. Position, normal and texcoord are interleaved in
// the vertex buffer; per-vertex color, when present, is a separate block.
class Mesh
{
public:
    explicit Mesh(std::string name);
    virtual ~Mesh();

    Mesh(const Mesh&) = delete;
    Mesh& operator=(const Mesh&) = delete;

    [[nodiscard]] const std::string& Name() const { return m_name; }

    // Builds CPU-side geometry. Must not touch the GPU; may run on a worker.
    virtual void Make() {}

    // Per-frame hook for dynamic meshes, called on the main thread with the
    // context current. Responsible for its own Set*Data and Transfer calls.
    virtual void Update(Scene& scene);

    void Reset();
    [[nodiscard]] MeshStatus Validate(std::string* outError = nullptr) const;

    [[nodiscard]] MeshStatus MakeVectors(Scene& scene, std::string* outError = nullptr);

    // Fast path: overwrite buffer contents assuming the element count did
    // not change since MakeVectors. Lengths are not re-checked.
    void SetVtxData(Scene& scene);
    void SetNormData(Scene& scene);
    void SetColorData(Scene& scene);

    [[nodiscard]] MeshStatus Activate(Scene& scene);
    void TransferAll();
    void TransferVectors();
    void TransferIndexes();
    void Render3D(Scene& scene);

    void AddPlane(const PlaneParams& params);
    bool SetPlaneVtx(std::size_t startIdx, const PlaneParams& params);
    [[nodiscard]] static std::size_t PlaneSize(int wsegs, int hsegs);

    void ComputeNorms();
    void ComputeBBox();

    [[nodiscard]] bool HasColor() const { return !colors.empty(); }
    [[nodiscard]] bool IsTransparent() const { return HasColor() && transparent; }

    [[nodiscard]] bool IsDynamic() const { return m_dynamic; }
    // The usage hint is fixed once the GPU buffer exists.
    bool SetDynamic(bool dynamic);

    [[nodiscard]] bool HasBuffer() const { return m_buffer != nullptr; }
    [[nodiscard]] gpu::BufferMgr* Buffer() { return m_buffer.get(); }
    [[nodiscard]] const MeshBBox& BBox() const { return m_bbox; }
    [[nodiscard]] std::size_t VertexCount() const { return vertices.size() / 3; }

    std::vector<float> vertices;
    std::vector<float> normals;
    std::vector<float> texCoords;
    std::vector<std::uint32_t> indices;
    std::vector<float> colors;
    bool transparent = false;

private:
    std::string m_name;
    bool m_dynamic = false;
    MeshBBox m_bbox;
    std::unique_ptr<gpu::BufferMgr> m_buffer;
};

// Single plane built from PlaneParams.
class PlaneMesh : public Mesh
{
public:
    PlaneMesh(std::string name, const PlaneParams& params) : Mesh(std::move(name)), m_params(params) {}

    void Make() override;

    [[nodiscard]] const PlaneParams& Params() const { return m_params; }
    void SetParams(const PlaneParams& params) { m_params = params; }

protected:
    PlaneParams m_params;
};
} // namespace canopy::scene

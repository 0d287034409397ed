#include "canopy/scene/Mesh.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <glm/common.hpp>
#include <glm/geometric.hpp>

#include "canopy/scene/Scene.hpp"

namespace canopy::scene
{
namespace
{
// Axis orthogonal to the plane spanned by waxis and haxis.
Axis OrthogonalAxis(Axis waxis, Axis haxis)
{
    if ((waxis == Axis::X && haxis == Axis::Z) || (waxis == Axis::Z && haxis == Axis::X))
    {
        return Axis::Y;
    }
    if ((waxis == Axis::Z && haxis == Axis::Y) || (waxis == Axis::Y && haxis == Axis::Z))
    {
        return Axis::X;
    }
    return Axis::Z;
}

void SetDim(glm::vec3& v, Axis axis, float value)
{
    v[static_cast<int>(axis)] = value;
}

MeshStatus Invalid(const std::string& message, std::string* outError)
{
    std::cerr << "[Mesh] " << message << "\n";
    if (outError != nullptr)
    {
        *outError = message;
    }
    return MeshStatus::ShapeInvalid;
}

// Grid vertex positions shared by AddPlane and SetPlaneVtx.
template <typename Emit>
void ForEachPlaneVertex(const PlaneParams& p, Emit&& emit)
{
    const Axis w = OrthogonalAxis(p.waxis, p.haxis);
    const int wsegs = std::max(p.wsegs, 1);
    const int hsegs = std::max(p.hsegs, 1);
    const float segWidth = p.width / static_cast<float>(wsegs);
    const float segHeight = p.height / static_cast<float>(hsegs);
    const float fwdir = static_cast<float>(p.wdir);
    const float fhdir = static_cast<float>(p.hdir);
    const float woff = p.wdir < 0 ? p.width + p.woff : p.woff;
    const float hoff = p.hdir < 0 ? p.height + p.hoff : p.hoff;

    for (int iy = 0; iy <= hsegs; ++iy)
    {
        for (int ix = 0; ix <= wsegs; ++ix)
        {
            glm::vec3 vtx{0.0F};
            SetDim(vtx, p.waxis, static_cast<float>(ix) * segWidth * fwdir + woff);
            SetDim(vtx, p.haxis, static_cast<float>(iy) * segHeight * fhdir + hoff);
            SetDim(vtx, w, p.zoff);
            emit(ix, iy, vtx);
        }
    }
}
} // namespace

Mesh::Mesh(std::string name) : m_name(std::move(name)) {}

Mesh::~Mesh() = default;

void Mesh::Update(Scene& /*scene*/)
{
}

void Mesh::Reset()
{
    vertices.clear();
    normals.clear();
    texCoords.clear();
    indices.clear();
    colors.clear();
}

MeshStatus Mesh::Validate(std::string* outError) const
{
    const std::size_t vln = vertices.size() / 3;
    if (vln == 0)
    {
        return Invalid("Mesh " + m_name + " has no vertices", outError);
    }
    const std::size_t nln = normals.size() / 3;
    if (nln != vln)
    {
        std::ostringstream msg;
        msg << "Mesh " << m_name << " number of normals: " << nln << " != vertices: " << vln;
        return Invalid(msg.str(), outError);
    }
    const std::size_t tln = texCoords.size() / 2;
    if (tln != vln)
    {
        std::ostringstream msg;
        msg << "Mesh " << m_name << " number of texcoords: " << tln << " != vertices: " << vln;
        return Invalid(msg.str(), outError);
    }
    const std::size_t cln = colors.size() / 4;
    if (cln != 0 && cln != vln)
    {
        std::ostringstream msg;
        msg << "Mesh " << m_name << " number of colors: " << cln << " != vertices: " << vln;
        return Invalid(msg.str(), outError);
    }
    return MeshStatus::Ok;
}

bool Mesh::SetDynamic(bool dynamic)
{
    if (m_buffer)
    {
        std::cerr << "[Mesh] " << m_name << ": dynamic flag cannot change after the buffer is allocated\n";
        return false;
    }
    m_dynamic = dynamic;
    return true;
}

MeshStatus Mesh::MakeVectors(Scene& scene, std::string* outError)
{
    if (!scene.IsActive())
    {
        std::cerr << "[Mesh] " << m_name << ": MakeVectors called without an active render context\n";
        if (outError != nullptr)
        {
            *outError = "render context inactive";
        }
        return MeshStatus::ContextInactive;
    }
    const MeshStatus status = Validate(outError);
    if (status != MeshStatus::Ok)
    {
        return status;
    }

    gpu::VectorsBuffer* vbuf = nullptr;
    gpu::IndexesBuffer* ibuf = nullptr;
    if (!m_buffer)
    {
        m_buffer = scene.GpuBackend().NewBufferMgr();
        vbuf = m_buffer->AddVectorsBuffer(m_dynamic ? gpu::BufferUsage::DynamicDraw : gpu::BufferUsage::StaticDraw);
        ibuf = m_buffer->AddIndexesBuffer(gpu::BufferUsage::StaticDraw);
    }
    else
    {
        vbuf = m_buffer->Vectors();
        ibuf = m_buffer->Indexes();
    }

    const bool hasColor = HasColor();
    const int nvec = hasColor ? 4 : 3;
    const gpu::VectorsDesc& pos = scene.Input(gpu::VectorRole::Position);
    const gpu::VectorsDesc& norm = scene.Input(gpu::VectorRole::Normal);
    const gpu::VectorsDesc& tex = scene.Input(gpu::VectorRole::TexCoord);
    const gpu::VectorsDesc& clr = scene.Input(gpu::VectorRole::Color);
    if (vbuf->NumVectors() != nvec)
    {
        vbuf->DeleteAllVectors();
        vbuf->AddVectors(pos, true);
        vbuf->AddVectors(norm, true);
        vbuf->AddVectors(tex, true);
        if (hasColor)
        {
            vbuf->AddVectors(clr, false);
        }
    }

    vbuf->SetLen(VertexCount());
    vbuf->SetVecData(pos, vertices);
    vbuf->SetVecData(norm, normals);
    vbuf->SetVecData(tex, texCoords);
    if (hasColor)
    {
        vbuf->SetVecData(clr, colors);
    }

    ibuf->SetLen(indices.size());
    ibuf->Set(indices);

    if (scene.Config().trace.mesh)
    {
        std::cout << "[Mesh] " << m_name << ": made " << VertexCount() << " vertices, " << indices.size() << " indices\n";
    }
    return MeshStatus::Ok;
}

void Mesh::SetVtxData(Scene& scene)
{
    if (!m_buffer)
    {
        std::cerr << "[Mesh] " << m_name << ": SetVtxData before MakeVectors\n";
        return;
    }
    m_buffer->Vectors()->SetVecData(scene.Input(gpu::VectorRole::Position), vertices);
}

void Mesh::SetNormData(Scene& scene)
{
    if (!m_buffer)
    {
        std::cerr << "[Mesh] " << m_name << ": SetNormData before MakeVectors\n";
        return;
    }
    m_buffer->Vectors()->SetVecData(scene.Input(gpu::VectorRole::Normal), normals);
}

void Mesh::SetColorData(Scene& scene)
{
    if (!m_buffer)
    {
        std::cerr << "[Mesh] " << m_name << ": SetColorData before MakeVectors\n";
        return;
    }
    m_buffer->Vectors()->SetVecData(scene.Input(gpu::VectorRole::Color), colors);
}

MeshStatus Mesh::Activate(Scene& scene)
{
    if (!m_buffer)
    {
        const MeshStatus status = MakeVectors(scene);
        if (status != MeshStatus::Ok)
        {
            return status;
        }
    }
    m_buffer->Activate();
    return MeshStatus::Ok;
}

void Mesh::TransferAll()
{
    if (m_buffer)
    {
        m_buffer->TransferAll();
    }
}

void Mesh::TransferVectors()
{
    if (m_buffer)
    {
        m_buffer->TransferVectors();
    }
}

void Mesh::TransferIndexes()
{
    if (m_buffer)
    {
        m_buffer->TransferIndexes();
    }
}

void Mesh::Render3D(Scene& scene)
{
    if (!m_buffer)
    {
        return;
    }
    gpu::IndexesBuffer* ibuf = m_buffer->Indexes();
    ibuf->Activate();
    scene.GpuBackend().TrianglesIndexed(0, ibuf->Len());
}

void Mesh::AddPlane(const PlaneParams& params)
{
    const auto idxSt = static_cast<std::uint32_t>(vertices.size() / 3);
    const Axis w = OrthogonalAxis(params.waxis, params.haxis);
    const int wsegs = std::max(params.wsegs, 1);
    const int hsegs = std::max(params.hsegs, 1);

    glm::vec3 norm{0.0F};
    SetDim(norm, w, params.zoff > 0.0F ? 1.0F : -1.0F);

    ForEachPlaneVertex(params, [&](int ix, int iy, const glm::vec3& vtx) {
        vertices.insert(vertices.end(), {vtx.x, vtx.y, vtx.z});
        normals.insert(normals.end(), {norm.x, norm.y, norm.z});
        texCoords.insert(texCoords.end(),
            {static_cast<float>(ix) / static_cast<float>(wsegs), 1.0F - static_cast<float>(iy) / static_cast<float>(hsegs)});
        if (params.hasColor)
        {
            colors.insert(colors.end(), {params.color.r, params.color.g, params.color.b, params.color.a});
        }
    });

    const auto wsegs1 = static_cast<std::uint32_t>(wsegs + 1);
    for (int iy = 0; iy < hsegs; ++iy)
    {
        for (int ix = 0; ix < wsegs; ++ix)
        {
            const auto x = static_cast<std::uint32_t>(ix);
            const auto y = static_cast<std::uint32_t>(iy);
            const std::uint32_t a = x + wsegs1 * y + idxSt;
            const std::uint32_t b = x + wsegs1 * (y + 1) + idxSt;
            const std::uint32_t c = (x + 1) + wsegs1 * (y + 1) + idxSt;
            const std::uint32_t d = (x + 1) + wsegs1 * y + idxSt;
            indices.insert(indices.end(), {a, b, d, b, c, d});
        }
    }
}

bool Mesh::SetPlaneVtx(std::size_t startIdx, const PlaneParams& params)
{
    const std::size_t count = PlaneSize(params.wsegs, params.hsegs);
    if ((startIdx + count) * 3 > vertices.size() || (params.hasColor && (startIdx + count) * 4 > colors.size()))
    {
        std::cerr << "[Mesh] " << m_name << ": SetPlaneVtx range exceeds built plane at vertex " << startIdx << "\n";
        return false;
    }

    std::size_t vidx = startIdx * 3;
    std::size_t cidx = startIdx * 4;
    ForEachPlaneVertex(params, [&](int /*ix*/, int /*iy*/, const glm::vec3& vtx) {
        vertices[vidx] = vtx.x;
        vertices[vidx + 1] = vtx.y;
        vertices[vidx + 2] = vtx.z;
        vidx += 3;
        if (params.hasColor)
        {
            colors[cidx] = params.color.r;
            colors[cidx + 1] = params.color.g;
            colors[cidx + 2] = params.color.b;
            colors[cidx + 3] = params.color.a;
            cidx += 4;
        }
    });
    return true;
}

std::size_t Mesh::PlaneSize(int wsegs, int hsegs)
{
    wsegs = std::max(wsegs, 1);
    hsegs = std::max(hsegs, 1);
    return static_cast<std::size_t>(wsegs + 1) * static_cast<std::size_t>(hsegs + 1);
}

void Mesh::ComputeNorms()
{
    normals.assign(vertices.size(), 0.0F);
    for (std::size_t i = 0; i + 2 < indices.size(); i += 3)
    {
        const std::uint32_t ia = indices[i];
        const std::uint32_t ib = indices[i + 1];
        const std::uint32_t ic = indices[i + 2];
        if ((std::max({ia, ib, ic}) + 1U) * 3U > vertices.size())
        {
            continue;
        }
        const glm::vec3 a{vertices[ia * 3], vertices[ia * 3 + 1], vertices[ia * 3 + 2]};
        const glm::vec3 b{vertices[ib * 3], vertices[ib * 3 + 1], vertices[ib * 3 + 2]};
        const glm::vec3 c{vertices[ic * 3], vertices[ic * 3 + 1], vertices[ic * 3 + 2]};
        const glm::vec3 face = glm::cross(b - a, c - a);
        for (std::uint32_t idx : {ia, ib, ic})
        {
            normals[idx * 3] += face.x;
            normals[idx * 3 + 1] += face.y;
            normals[idx * 3 + 2] += face.z;
        }
    }
    for (std::size_t v = 0; v + 2 < normals.size(); v += 3)
    {
        glm::vec3 n{normals[v], normals[v + 1], normals[v + 2]};
        const float len = glm::length(n);
        if (len > 1.0e-6F)
        {
            n /= len;
        }
        normals[v] = n.x;
        normals[v + 1] = n.y;
        normals[v + 2] = n.z;
    }
}

void Mesh::ComputeBBox()
{
    if (vertices.size() < 3)
    {
        m_bbox = MeshBBox{};
        return;
    }
    m_bbox.min = glm::vec3{vertices[0], vertices[1], vertices[2]};
    m_bbox.max = m_bbox.min;
    for (std::size_t v = 3; v + 2 < vertices.size(); v += 3)
    {
        const glm::vec3 p{vertices[v], vertices[v + 1], vertices[v + 2]};
        m_bbox.min = glm::min(m_bbox.min, p);
        m_bbox.max = glm::max(m_bbox.max, p);
    }
}

void PlaneMesh::Make()
{
    Reset();
    AddPlane(m_params);
    ComputeBBox();
}
} // namespace canopy::scene

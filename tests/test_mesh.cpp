#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

#include "canopy/core/Config.hpp"
#include "canopy/core/WorkerPool.hpp"
#include "canopy/scene/Mesh.hpp"
#include "canopy/scene/Scene.hpp"
#include "tests/FakeGpu.hpp"

using namespace canopy;

namespace
{
scene::PlaneParams GridParams(int wsegs, int hsegs)
{
    scene::PlaneParams params;
    params.width = 2.0F;
    params.height = 1.0F;
    params.wsegs = wsegs;
    params.hsegs = hsegs;
    return params;
}

struct SceneFixture
{
    core::ToolkitConfig config;
    test::FakeGpu gpu;
    scene::Scene scene{gpu, config};

    SceneFixture()
    {
        REQUIRE(scene.Init());
    }
};
} // namespace

TEST_CASE("Mesh validation", "[Mesh]")
{
    SECTION("Empty mesh is rejected")
    {
        scene::Mesh mesh("empty");
        std::string error;
        REQUIRE(mesh.Validate(&error) == scene::MeshStatus::ShapeInvalid);
        REQUIRE(error.find("no vertices") != std::string::npos);
    }

    SECTION("Normal count must match vertex count")
    {
        scene::Mesh mesh("bad-normals");
        mesh.vertices = {0.0F, 0.0F, 0.0F, 1.0F, 0.0F, 0.0F};
        mesh.normals = {0.0F, 0.0F, 1.0F};
        mesh.texCoords = {0.0F, 0.0F, 1.0F, 0.0F};
        std::string error;
        REQUIRE(mesh.Validate(&error) == scene::MeshStatus::ShapeInvalid);
        REQUIRE(error.find("normals: 1 != vertices: 2") != std::string::npos);
    }

    SECTION("Texcoord count must match vertex count")
    {
        scene::Mesh mesh("bad-texcoords");
        mesh.AddPlane(GridParams(1, 1));
        mesh.texCoords.resize(mesh.texCoords.size() - 2);
        std::string error;
        REQUIRE(mesh.Validate(&error) == scene::MeshStatus::ShapeInvalid);
        REQUIRE(error.find("texcoords: 3 != vertices: 4") != std::string::npos);
    }

    SECTION("Color count must match when colors are present")
    {
        scene::Mesh mesh("bad-colors");
        mesh.AddPlane(GridParams(1, 1));
        mesh.colors = {1.0F, 1.0F, 1.0F, 1.0F};
        REQUIRE(mesh.Validate() == scene::MeshStatus::ShapeInvalid);
        mesh.colors.clear();
        REQUIRE(mesh.Validate() == scene::MeshStatus::Ok);
    }
}

TEST_CASE("Plane construction", "[Mesh]")
{
    SECTION("PlaneSize counts grid corners")
    {
        REQUIRE(scene::Mesh::PlaneSize(1, 1) == 4);
        REQUIRE(scene::Mesh::PlaneSize(3, 2) == 12);
        REQUIRE(scene::Mesh::PlaneSize(0, 0) == 4);
    }

    SECTION("AddPlane emits two triangles per segment")
    {
        scene::Mesh mesh("plane");
        mesh.AddPlane(GridParams(3, 2));
        REQUIRE(mesh.VertexCount() == scene::Mesh::PlaneSize(3, 2));
        REQUIRE(mesh.indices.size() == 6U * 3U * 2U);
        REQUIRE(mesh.normals.size() == mesh.vertices.size());
        REQUIRE(mesh.texCoords.size() == mesh.VertexCount() * 2);
        REQUIRE_FALSE(mesh.HasColor());
    }

    SECTION("A second plane offsets its indices")
    {
        scene::Mesh mesh("two");
        mesh.AddPlane(GridParams(1, 1));
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.VertexCount() == 8);
        REQUIRE(mesh.indices.size() == 12);
        for (std::size_t i = 6; i < 12; ++i)
        {
            REQUIRE(mesh.indices[i] >= 4U);
        }
    }

    SECTION("Negative direction mirrors across the plane extent")
    {
        scene::PlaneParams params = GridParams(1, 1);
        params.wdir = -1;
        scene::Mesh mesh("mirrored");
        mesh.AddPlane(params);
        mesh.ComputeBBox();
        REQUIRE(mesh.BBox().min.x == Approx(0.0F));
        REQUIRE(mesh.BBox().max.x == Approx(2.0F));
        REQUIRE(mesh.vertices[0] == Approx(2.0F));
    }

    SECTION("SetPlaneVtx rewrites positions in place")
    {
        scene::Mesh mesh("grid");
        scene::PlaneParams params = GridParams(2, 2);
        mesh.AddPlane(params);
        const std::size_t indexCount = mesh.indices.size();

        params.zoff = 0.5F;
        REQUIRE(mesh.SetPlaneVtx(0, params));
        REQUIRE(mesh.indices.size() == indexCount);
        for (std::size_t v = 0; v < mesh.VertexCount(); ++v)
        {
            REQUIRE(mesh.vertices[v * 3 + 2] == Approx(0.5F));
        }
    }

    SECTION("SetPlaneVtx refuses a range past the built plane")
    {
        scene::Mesh mesh("small");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE_FALSE(mesh.SetPlaneVtx(0, GridParams(2, 2)));
        REQUIRE_FALSE(mesh.SetPlaneVtx(1, GridParams(1, 1)));
    }
}

TEST_CASE("Mesh GPU buffers", "[Mesh]")
{
    SceneFixture fx;

    SECTION("MakeVectors needs an active scene")
    {
        fx.scene.SetActive(false);
        scene::Mesh mesh("inactive");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::ContextInactive);
        REQUIRE_FALSE(mesh.HasBuffer());
        REQUIRE(fx.gpu.stats.buffersCreated == 0);
    }

    SECTION("Invalid shape never allocates a buffer")
    {
        scene::Mesh mesh("invalid");
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::ShapeInvalid);
        REQUIRE_FALSE(mesh.HasBuffer());
    }

    SECTION("MakeVectors reuses the buffer on rebuild")
    {
        scene::Mesh mesh("reuse");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        gpu::BufferMgr* first = mesh.Buffer();

        mesh.AddPlane(GridParams(2, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        REQUIRE(mesh.Buffer() == first);
        REQUIRE(fx.gpu.stats.buffersCreated == 1);
        REQUIRE(mesh.Buffer()->Vectors()->Len() == mesh.VertexCount());
        REQUIRE(mesh.Buffer()->Indexes()->Len() == mesh.indices.size());
    }

    SECTION("Position, normal and texcoord are interleaved; color is a block")
    {
        scene::PlaneParams params = GridParams(1, 1);
        params.hasColor = true;
        params.color = glm::vec4{1.0F, 0.5F, 0.25F, 1.0F};
        scene::Mesh mesh("colored");
        mesh.AddPlane(params);
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);

        gpu::VectorsBuffer* vbuf = mesh.Buffer()->Vectors();
        REQUIRE(vbuf->NumVectors() == 4);
        REQUIRE(vbuf->Stride() == 8);
        REQUIRE(vbuf->IsInterleaved(fx.scene.Input(gpu::VectorRole::TexCoord)));
        REQUIRE_FALSE(vbuf->IsInterleaved(fx.scene.Input(gpu::VectorRole::Color)));
        REQUIRE(vbuf->Offset(fx.scene.Input(gpu::VectorRole::Normal)) == 3);
        REQUIRE(vbuf->Offset(fx.scene.Input(gpu::VectorRole::Color)) == 4 * 8);
    }

    SECTION("Dynamic hint selects the buffer usage and is fixed afterwards")
    {
        scene::Mesh mesh("dynamic");
        REQUIRE(mesh.SetDynamic(true));
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        REQUIRE(mesh.Buffer()->Vectors()->Usage() == gpu::BufferUsage::DynamicDraw);
        REQUIRE(mesh.Buffer()->Indexes()->Usage() == gpu::BufferUsage::StaticDraw);
        REQUIRE_FALSE(mesh.SetDynamic(false));
        REQUIRE(mesh.IsDynamic());
    }

    SECTION("Activate builds lazily but does not transfer")
    {
        scene::Mesh mesh("lazy");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.Activate(fx.scene) == scene::MeshStatus::Ok);
        REQUIRE(mesh.HasBuffer());
        REQUIRE(fx.gpu.stats.vectorTransfers == 0);
        REQUIRE(fx.gpu.stats.indexTransfers == 0);
    }

    SECTION("SetVtxData updates positions without resizing")
    {
        scene::Mesh mesh("fast");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        mesh.TransferAll();

        mesh.vertices[0] = 9.0F;
        mesh.SetVtxData(fx.scene);
        mesh.TransferVectors();
        auto* vbuf = static_cast<test::FakeVectorsBuffer*>(mesh.Buffer()->Vectors());
        REQUIRE(vbuf->uploaded[0] == Approx(9.0F));
        REQUIRE(fx.gpu.stats.vectorTransfers == 2);
        REQUIRE(fx.gpu.stats.indexTransfers == 1);
    }

    SECTION("Normals and colors have their own fast paths")
    {
        scene::PlaneParams params = GridParams(1, 1);
        params.hasColor = true;
        scene::Mesh mesh("recolor");
        mesh.AddPlane(params);
        mesh.transparent = true;
        REQUIRE(mesh.IsTransparent());
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);

        mesh.normals[0] = 0.25F;
        mesh.colors[0] = 0.5F;
        mesh.SetNormData(fx.scene);
        mesh.SetColorData(fx.scene);
        mesh.TransferVectors();
        mesh.TransferIndexes();
        auto* vbuf = static_cast<test::FakeVectorsBuffer*>(mesh.Buffer()->Vectors());
        REQUIRE(vbuf->uploaded[3] == Approx(0.25F));
        REQUIRE(vbuf->uploaded[4 * 8] == Approx(0.5F));
        REQUIRE(fx.gpu.stats.indexTransfers == 1);

        mesh.Render3D(fx.scene);
        REQUIRE(fx.gpu.stats.drawCounts == std::vector<std::size_t>{6});
    }

    SECTION("Reset clears geometry but keeps the buffer")
    {
        scene::Mesh mesh("reset");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        mesh.Reset();
        REQUIRE(mesh.VertexCount() == 0);
        REQUIRE(mesh.indices.empty());
        REQUIRE_FALSE(mesh.HasColor());
        REQUIRE(mesh.HasBuffer());
        REQUIRE(mesh.Validate() == scene::MeshStatus::ShapeInvalid);
    }

    SECTION("SetVtxData after a shape change keeps the old element count")
    {
        scene::Mesh mesh("contract");
        mesh.AddPlane(GridParams(1, 1));
        REQUIRE(mesh.MakeVectors(fx.scene) == scene::MeshStatus::Ok);
        const std::size_t builtLen = mesh.Buffer()->Vectors()->Len();

        mesh.AddPlane(GridParams(1, 1));
        mesh.SetVtxData(fx.scene);
        REQUIRE(mesh.Buffer()->Vectors()->Len() == builtLen);
        REQUIRE(mesh.Buffer()->Vectors()->VecData(fx.scene.Input(gpu::VectorRole::Position))->size() == builtLen * 3);
    }
}

TEST_CASE("Scene builds and draws meshes", "[Scene]")
{
    SceneFixture fx;

    SECTION("Program compile failure leaves the scene inactive")
    {
        core::ToolkitConfig config;
        test::FakeGpu gpu;
        gpu.failCompile = true;
        scene::Scene broken(gpu, config);
        std::string error;
        REQUIRE_FALSE(broken.Init(&error));
        REQUIRE_FALSE(broken.IsActive());
        REQUIRE(error == "fake compile failure");
    }

    SECTION("BuildMeshes makes, uploads and reports failures")
    {
        fx.scene.AddMesh(std::make_unique<scene::PlaneMesh>("a", GridParams(2, 2)));
        fx.scene.AddMesh(std::make_unique<scene::Mesh>("empty"));
        core::WorkerPool pool;
        REQUIRE(pool.Initialize(2));
        REQUIRE(fx.scene.BuildMeshes(&pool) == 1);
        pool.Shutdown();

        scene::Mesh* mesh = fx.scene.FindMesh("a");
        REQUIRE(mesh != nullptr);
        REQUIRE(mesh->HasBuffer());
        REQUIRE_FALSE(fx.scene.FindMesh("empty")->HasBuffer());
        REQUIRE(fx.gpu.stats.vectorTransfers == 1);
        REQUIRE(fx.gpu.stats.indexTransfers == 1);
    }

    SECTION("Render draws every object with a built mesh")
    {
        fx.scene.AddMesh(std::make_unique<scene::PlaneMesh>("quad", GridParams(1, 1)));
        fx.scene.AddMesh(std::make_unique<scene::Mesh>("empty"));
        fx.scene.AddObject("one", "quad");
        fx.scene.AddObject("two", "quad").color = glm::vec4{1.0F, 0.0F, 0.0F, 1.0F};
        fx.scene.AddObject("ghost", "empty");
        fx.scene.AddObject("missing", "nothing");
        REQUIRE(fx.scene.BuildMeshes() == 1);

        fx.scene.Render(glm::mat4{1.0F});
        REQUIRE(fx.gpu.stats.drawCounts.size() == 2);
        REQUIRE(fx.gpu.stats.drawCounts[0] == 6);
        REQUIRE(fx.gpu.stats.uniforms.count("uViewProjection") == 1);
    }

    SECTION("Only dynamic meshes are updated")
    {
        struct CountingMesh final : scene::PlaneMesh
        {
            using PlaneMesh::PlaneMesh;
            void Update(scene::Scene& /*scene*/) override { ++updates; }
            int updates = 0;
        };
        auto* fixed = static_cast<CountingMesh*>(fx.scene.AddMesh(std::make_unique<CountingMesh>("fixed", GridParams(1, 1))));
        auto dyn = std::make_unique<CountingMesh>("dyn", GridParams(1, 1));
        REQUIRE(dyn->SetDynamic(true));
        auto* dynamic = static_cast<CountingMesh*>(fx.scene.AddMesh(std::move(dyn)));
        REQUIRE(fx.scene.BuildMeshes() == 0);

        fx.scene.UpdateMeshes();
        fx.scene.UpdateMeshes();
        REQUIRE(fixed->updates == 0);
        REQUIRE(dynamic->updates == 2);
    }
}

#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

#include "canopy/core/Config.hpp"
#include "canopy/gpu/Gpu.hpp"
#include "canopy/scene/Mesh.hpp"

namespace canopy::core
{
class WorkerPool;
}

namespace canopy::scene
{
struct SceneObject
{
    std::string name;
    std::string meshName;
    glm::mat4 transform{1.0F};
    glm::vec4 color{1.0F};
};

struct SceneLight
{
    glm::vec3 direction{-0.4F, -1.0F, -0.3F};
    glm::vec3 color{1.0F, 1.0F, 1.0F};
    float ambient = 0.25F;
};

// Meshes plus the objects that draw them. All GPU work happens on the thread
// that owns the context; only Mesh::Make is dispatched to workers.
class Scene
{
public:
    Scene(gpu::Gpu& gpu, const core::ToolkitConfig& config);
    ~Scene();

    Scene(const Scene&) = delete;
    Scene& operator=(const Scene&) = delete;

    // Compiles the mesh program. Marks the scene active on success.
    bool Init(std::string* outError = nullptr);

    void SetActive(bool active) { m_active = active; }
    [[nodiscard]] bool IsActive() const { return m_active; }

    [[nodiscard]] const gpu::VectorsDesc& Input(gpu::VectorRole role) const;
    [[nodiscard]] gpu::Gpu& GpuBackend() { return m_gpu; }
    [[nodiscard]] const core::ToolkitConfig& Config() const { return m_config; }

    Mesh* AddMesh(std::unique_ptr<Mesh> mesh);
    [[nodiscard]] Mesh* FindMesh(const std::string& name);
    SceneObject& AddObject(const std::string& name, const std::string& meshName);
    [[nodiscard]] SceneObject* FindObject(const std::string& name);

    // Runs Make on every mesh (in parallel when a pool is given), then builds
    // and uploads GPU buffers here. Returns the number of meshes that failed.
    std::size_t BuildMeshes(core::WorkerPool* pool = nullptr);
    void UpdateMeshes();
    void Render(const glm::mat4& viewProjection);

    SceneLight& Light() { return m_light; }

private:
    gpu::Gpu& m_gpu;
    const core::ToolkitConfig& m_config;
    std::unique_ptr<gpu::Program> m_program;
    std::array<const gpu::VectorsDesc*, 4> m_inputs{};
    bool m_active = false;
    SceneLight m_light;
    std::vector<std::unique_ptr<Mesh>> m_meshes;
    std::vector<SceneObject> m_objects;
};
} // namespace canopy::scene

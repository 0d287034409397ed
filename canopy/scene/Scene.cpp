#include "canopy/scene/Scene.hpp"

#include <iostream>

#include <glm/geometric.hpp>

#include "canopy/core/WorkerPool.hpp"

namespace canopy::scene
{
namespace
{
constexpr const char* kMeshVertexShader = R"(
#version 450 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aNormal;
layout (location = 2) in vec2 aTexCoord;
layout (location = 3) in vec4 aColor;
uniform mat4 uViewProjection;
uniform mat4 uModel;
uniform vec4 uColor;
uniform int uVertexColor;
out vec3 vNormal;
out vec4 vColor;
out vec2 vTexCoord;
void main()
{
    vec4 worldPos = uModel * vec4(aPosition, 1.0);
    vNormal = mat3(uModel) * aNormal;
    vColor = uVertexColor != 0 ? aColor * uColor : uColor;
    vTexCoord = aTexCoord;
    gl_Position = uViewProjection * worldPos;
}
)";

constexpr const char* kMeshFragmentShader = R"(
#version 450 core
in vec3 vNormal;
in vec4 vColor;
in vec2 vTexCoord;
out vec4 FragColor;
uniform vec3 uLightDir;
uniform vec3 uLightColor;
uniform float uAmbient;
void main()
{
    vec3 n = normalize(vNormal);
    float diffuse = abs(dot(n, -normalize(uLightDir)));
    vec3 lit = vColor.rgb * (uAmbient + (1.0 - uAmbient) * diffuse * uLightColor);
    FragColor = vec4(pow(max(lit, vec3(0.0)), vec3(1.0 / 2.2)), vColor.a);
}
)";
} // namespace

Scene::Scene(gpu::Gpu& gpu, const core::ToolkitConfig& config) : m_gpu(gpu), m_config(config)
{
    m_program = m_gpu.NewProgram("mesh");
    m_program->AddShader(gpu::ShaderType::Vertex, kMeshVertexShader);
    m_program->AddShader(gpu::ShaderType::Fragment, kMeshFragmentShader);
    m_inputs[static_cast<std::size_t>(gpu::VectorRole::Position)] = &m_program->AddInput("aPosition", gpu::VectorRole::Position, 3, 0);
    m_inputs[static_cast<std::size_t>(gpu::VectorRole::Normal)] = &m_program->AddInput("aNormal", gpu::VectorRole::Normal, 3, 1);
    m_inputs[static_cast<std::size_t>(gpu::VectorRole::TexCoord)] = &m_program->AddInput("aTexCoord", gpu::VectorRole::TexCoord, 2, 2);
    m_inputs[static_cast<std::size_t>(gpu::VectorRole::Color)] = &m_program->AddInput("aColor", gpu::VectorRole::Color, 4, 3);
    for (const char* uniform : {"uViewProjection", "uModel", "uColor", "uVertexColor", "uLightDir", "uLightColor", "uAmbient"})
    {
        m_program->AddUniform(uniform);
    }
}

Scene::~Scene() = default;

bool Scene::Init(std::string* outError)
{
    if (!m_program->Compile(outError))
    {
        std::cerr << "[Scene] Mesh program failed to compile\n";
        m_active = false;
        return false;
    }
    m_active = true;
    return true;
}

const gpu::VectorsDesc& Scene::Input(gpu::VectorRole role) const
{
    return *m_inputs[static_cast<std::size_t>(role)];
}

Mesh* Scene::AddMesh(std::unique_ptr<Mesh> mesh)
{
    if (!mesh)
    {
        return nullptr;
    }
    m_meshes.push_back(std::move(mesh));
    return m_meshes.back().get();
}

Mesh* Scene::FindMesh(const std::string& name)
{
    for (const auto& mesh : m_meshes)
    {
        if (mesh->Name() == name)
        {
            return mesh.get();
        }
    }
    return nullptr;
}

SceneObject& Scene::AddObject(const std::string& name, const std::string& meshName)
{
    m_objects.push_back(SceneObject{name, meshName});
    return m_objects.back();
}

SceneObject* Scene::FindObject(const std::string& name)
{
    for (SceneObject& object : m_objects)
    {
        if (object.name == name)
        {
            return &object;
        }
    }
    return nullptr;
}

std::size_t Scene::BuildMeshes(core::WorkerPool* pool)
{
    if (pool != nullptr)
    {
        core::WorkCounter counter;
        pool->ParallelFor(m_meshes.size(), [this](std::size_t i) { m_meshes[i]->Make(); }, counter);
        counter.Wait();
    }
    else
    {
        for (const auto& mesh : m_meshes)
        {
            mesh->Make();
        }
    }

    std::size_t failed = 0;
    for (const auto& mesh : m_meshes)
    {
        if (mesh->MakeVectors(*this) != MeshStatus::Ok)
        {
            ++failed;
            continue;
        }
        if (mesh->Activate(*this) != MeshStatus::Ok)
        {
            ++failed;
            continue;
        }
        mesh->TransferAll();
    }
    if (failed > 0)
    {
        std::cerr << "[Scene] " << failed << " of " << m_meshes.size() << " meshes failed to build\n";
    }
    return failed;
}

void Scene::UpdateMeshes()
{
    if (!m_active)
    {
        return;
    }
    for (const auto& mesh : m_meshes)
    {
        if (!mesh->IsDynamic() || !mesh->HasBuffer())
        {
            continue;
        }
        if (mesh->Activate(*this) == MeshStatus::Ok)
        {
            mesh->Update(*this);
        }
    }
}

void Scene::Render(const glm::mat4& viewProjection)
{
    if (!m_active)
    {
        return;
    }
    m_program->Activate();
    m_program->SetUniform("uViewProjection", viewProjection);
    m_program->SetUniform("uLightDir", glm::normalize(m_light.direction));
    m_program->SetUniform("uLightColor", m_light.color);
    m_program->SetUniform("uAmbient", m_light.ambient);

    for (const SceneObject& object : m_objects)
    {
        Mesh* mesh = FindMesh(object.meshName);
        // Meshes that failed validation never got a buffer and are skipped.
        if (mesh == nullptr || !mesh->HasBuffer())
        {
            continue;
        }
        m_program->SetUniform("uModel", object.transform);
        m_program->SetUniform("uColor", object.color);
        m_program->SetUniform("uVertexColor", mesh->HasColor() ? 1 : 0);
        if (mesh->Activate(*this) != MeshStatus::Ok)
        {
            continue;
        }
        mesh->Render3D(*this);
    }
}
} // namespace canopy::scene

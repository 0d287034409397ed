#include "canopy/gpu/GlGpu.hpp"

#include <cstdint>
#include <iostream>
#include <type_traits>

#include <glad/glad.h>
#include <glm/gtc/type_ptr.hpp>

namespace canopy::gpu
{
namespace
{
GLenum ToGlUsage(BufferUsage usage)
{
    switch (usage)
    {
        case BufferUsage::DynamicDraw:
            return GL_DYNAMIC_DRAW;
        case BufferUsage::StreamDraw:
            return GL_STREAM_DRAW;
        case BufferUsage::StaticDraw:
        default:
            return GL_STATIC_DRAW;
    }
}

unsigned int CompileShader(GLenum type, const std::string& source, std::string* outError)
{
    const unsigned int shader = glCreateShader(type);
    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);
    int ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok == GL_TRUE)
    {
        return shader;
    }
    char log[1024]{};
    glGetShaderInfoLog(shader, static_cast<int>(sizeof(log)), nullptr, log);
    if (outError != nullptr)
    {
        *outError = log;
    }
    glDeleteShader(shader);
    return 0;
}
} // namespace

GlProgram::~GlProgram()
{
    if (m_handle != 0)
    {
        glDeleteProgram(m_handle);
    }
}

bool GlProgram::Compile(std::string* outError)
{
    std::vector<unsigned int> shaders;
    for (const ShaderSource& src : m_shaders)
    {
        const GLenum type = src.type == ShaderType::Vertex ? GL_VERTEX_SHADER : GL_FRAGMENT_SHADER;
        const unsigned int shader = CompileShader(type, src.source, outError);
        if (shader == 0)
        {
            std::cerr << "[Gpu] Shader compile failed in program " << m_name << "\n";
            for (unsigned int s : shaders)
            {
                glDeleteShader(s);
            }
            return false;
        }
        shaders.push_back(shader);
    }

    const unsigned int program = glCreateProgram();
    for (unsigned int s : shaders)
    {
        glAttachShader(program, s);
    }
    for (const auto& input : m_inputs)
    {
        glBindAttribLocation(program, static_cast<GLuint>(input->location), input->name.c_str());
    }
    glLinkProgram(program);
    for (unsigned int s : shaders)
    {
        glDeleteShader(s);
    }

    int ok = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (ok != GL_TRUE)
    {
        char log[1024]{};
        glGetProgramInfoLog(program, static_cast<int>(sizeof(log)), nullptr, log);
        if (outError != nullptr)
        {
            *outError = log;
        }
        std::cerr << "[Gpu] Program link failed for " << m_name << ": " << log << "\n";
        glDeleteProgram(program);
        return false;
    }

    if (m_handle != 0)
    {
        glDeleteProgram(m_handle);
    }
    m_handle = program;
    m_uniformLocations.clear();
    for (const std::string& uniform : m_uniforms)
    {
        m_uniformLocations[uniform] = glGetUniformLocation(m_handle, uniform.c_str());
    }
    return true;
}

void GlProgram::Activate()
{
    glUseProgram(m_handle);
}

void GlProgram::SetUniform(const std::string& name, const UniformValue& value)
{
    const auto it = m_uniformLocations.find(name);
    if (it == m_uniformLocations.end() || it->second < 0)
    {
        return;
    }
    const int location = it->second;
    std::visit(
        [location](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int>)
            {
                glUniform1i(location, v);
            }
            else if constexpr (std::is_same_v<T, float>)
            {
                glUniform1f(location, v);
            }
            else if constexpr (std::is_same_v<T, glm::vec2>)
            {
                glUniform2fv(location, 1, glm::value_ptr(v));
            }
            else if constexpr (std::is_same_v<T, glm::vec3>)
            {
                glUniform3fv(location, 1, glm::value_ptr(v));
            }
            else if constexpr (std::is_same_v<T, glm::vec4>)
            {
                glUniform4fv(location, 1, glm::value_ptr(v));
            }
            else
            {
                glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(v));
            }
        },
        value);
}

GlVectorsBuffer::GlVectorsBuffer(BufferUsage usage) : VectorsBuffer(usage)
{
    glGenBuffers(1, &m_vbo);
}

GlVectorsBuffer::~GlVectorsBuffer()
{
    if (m_vbo != 0)
    {
        glDeleteBuffers(1, &m_vbo);
    }
}

void GlVectorsBuffer::Activate()
{
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    if (LayoutChanged())
    {
        ApplyLayout();
        ClearLayoutChanged();
    }
}

void GlVectorsBuffer::ApplyLayout()
{
    const GLsizei stride = static_cast<GLsizei>(Stride() * static_cast<int>(sizeof(float)));
    for (const Entry& entry : Entries())
    {
        const VectorsDesc& desc = *entry.desc;
        const std::size_t offsetBytes = Offset(desc) * sizeof(float);
        glVertexAttribPointer(
            static_cast<GLuint>(desc.location),
            desc.components,
            GL_FLOAT,
            GL_FALSE,
            entry.interleave ? stride : 0,
            reinterpret_cast<void*>(offsetBytes));
        glEnableVertexAttribArray(static_cast<GLuint>(desc.location));
    }
}

void GlVectorsBuffer::Transfer()
{
    const std::vector<float> all = AllData();
    const std::size_t bytes = all.size() * sizeof(float);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    if (bytes == m_capacityBytes && Usage() != BufferUsage::StaticDraw)
    {
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes), all.data());
        return;
    }
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes), all.data(), ToGlUsage(Usage()));
    m_capacityBytes = bytes;
}

GlIndexesBuffer::GlIndexesBuffer(BufferUsage usage) : IndexesBuffer(usage)
{
    glGenBuffers(1, &m_ebo);
}

GlIndexesBuffer::~GlIndexesBuffer()
{
    if (m_ebo != 0)
    {
        glDeleteBuffers(1, &m_ebo);
    }
}

void GlIndexesBuffer::Activate()
{
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
}

void GlIndexesBuffer::Transfer()
{
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_ebo);
    glBufferData(
        GL_ELEMENT_ARRAY_BUFFER,
        static_cast<GLsizeiptr>(Data().size() * sizeof(std::uint32_t)),
        Data().data(),
        ToGlUsage(Usage()));
}

GlBufferMgr::GlBufferMgr()
{
    glGenVertexArrays(1, &m_vao);
}

GlBufferMgr::~GlBufferMgr()
{
    m_vectors.reset();
    m_indexes.reset();
    if (m_vao != 0)
    {
        glDeleteVertexArrays(1, &m_vao);
    }
}

void GlBufferMgr::Activate()
{
    glBindVertexArray(m_vao);
    if (m_vectors)
    {
        m_vectors->Activate();
    }
    if (m_indexes)
    {
        m_indexes->Activate();
    }
}

std::unique_ptr<VectorsBuffer> GlBufferMgr::CreateVectorsBuffer(BufferUsage usage)
{
    return std::make_unique<GlVectorsBuffer>(usage);
}

std::unique_ptr<IndexesBuffer> GlBufferMgr::CreateIndexesBuffer(BufferUsage usage)
{
    return std::make_unique<GlIndexesBuffer>(usage);
}

std::unique_ptr<Program> GlGpu::NewProgram(const std::string& name)
{
    return std::make_unique<GlProgram>(name);
}

std::unique_ptr<BufferMgr> GlGpu::NewBufferMgr()
{
    return std::make_unique<GlBufferMgr>();
}

void GlGpu::TrianglesIndexed(std::size_t start, std::size_t count)
{
    glDrawElements(
        GL_TRIANGLES,
        static_cast<GLsizei>(count),
        GL_UNSIGNED_INT,
        reinterpret_cast<void*>(start * sizeof(std::uint32_t)));
}
} // namespace canopy::gpu

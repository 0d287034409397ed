#include "canopy/gpu/Gpu.hpp"

#include <algorithm>
#include <iostream>

namespace canopy::gpu
{
void Program::AddShader(ShaderType type, std::string source)
{
    m_shaders.push_back(ShaderSource{type, std::move(source)});
}

void Program::AddUniform(const std::string& name)
{
    if (std::find(m_uniforms.begin(), m_uniforms.end(), name) == m_uniforms.end())
    {
        m_uniforms.push_back(name);
    }
}

const VectorsDesc& Program::AddInput(const std::string& name, VectorRole role, int components, int location)
{
    m_inputs.push_back(std::make_unique<VectorsDesc>(VectorsDesc{name, role, components, location}));
    return *m_inputs.back();
}

void VectorsBuffer::AddVectors(const VectorsDesc& desc, bool interleave)
{
    Entry entry;
    entry.desc = &desc;
    entry.interleave = interleave;
    entry.data.resize(m_len * static_cast<std::size_t>(desc.components), 0.0F);
    m_vectors.push_back(std::move(entry));
    m_layoutChanged = true;
}

void VectorsBuffer::DeleteAllVectors()
{
    m_vectors.clear();
    m_layoutChanged = true;
}

void VectorsBuffer::SetLen(std::size_t len)
{
    if (len != m_len)
    {
        m_layoutChanged = true;
    }
    m_len = len;
    for (Entry& entry : m_vectors)
    {
        entry.data.resize(m_len * static_cast<std::size_t>(entry.desc->components), 0.0F);
    }
}

void VectorsBuffer::SetVecData(const VectorsDesc& desc, const std::vector<float>& data)
{
    Entry* entry = FindEntry(desc);
    if (entry == nullptr)
    {
        std::cerr << "[Gpu] SetVecData: vectors '" << desc.name << "' not in buffer\n";
        return;
    }
    const std::size_t n = std::min(entry->data.size(), data.size());
    std::copy_n(data.begin(), n, entry->data.begin());
}

const std::vector<float>* VectorsBuffer::VecData(const VectorsDesc& desc) const
{
    const Entry* entry = FindEntry(desc);
    return entry != nullptr ? &entry->data : nullptr;
}

int VectorsBuffer::Stride() const
{
    int stride = 0;
    for (const Entry& entry : m_vectors)
    {
        if (entry.interleave)
        {
            stride += entry.desc->components;
        }
    }
    return stride;
}

bool VectorsBuffer::IsInterleaved(const VectorsDesc& desc) const
{
    const Entry* entry = FindEntry(desc);
    return entry != nullptr && entry->interleave;
}

std::size_t VectorsBuffer::Offset(const VectorsDesc& desc) const
{
    // In floats: position within a vertex for interleaved vectors, start of
    // the block for the rest.
    std::size_t interleavedOffset = 0;
    std::size_t blockOffset = m_len * static_cast<std::size_t>(Stride());
    for (const Entry& entry : m_vectors)
    {
        if (entry.desc == &desc)
        {
            return entry.interleave ? interleavedOffset : blockOffset;
        }
        if (entry.interleave)
        {
            interleavedOffset += static_cast<std::size_t>(entry.desc->components);
        }
        else
        {
            blockOffset += entry.data.size();
        }
    }
    return 0;
}

std::vector<float> VectorsBuffer::AllData() const
{
    const int stride = Stride();
    std::vector<float> all;
    all.reserve(m_len * static_cast<std::size_t>(stride));
    for (std::size_t v = 0; v < m_len; ++v)
    {
        for (const Entry& entry : m_vectors)
        {
            if (!entry.interleave)
            {
                continue;
            }
            const std::size_t comps = static_cast<std::size_t>(entry.desc->components);
            all.insert(all.end(), entry.data.begin() + static_cast<std::ptrdiff_t>(v * comps),
                entry.data.begin() + static_cast<std::ptrdiff_t>((v + 1) * comps));
        }
    }
    for (const Entry& entry : m_vectors)
    {
        if (!entry.interleave)
        {
            all.insert(all.end(), entry.data.begin(), entry.data.end());
        }
    }
    return all;
}

VectorsBuffer::Entry* VectorsBuffer::FindEntry(const VectorsDesc& desc)
{
    for (Entry& entry : m_vectors)
    {
        if (entry.desc == &desc)
        {
            return &entry;
        }
    }
    return nullptr;
}

const VectorsBuffer::Entry* VectorsBuffer::FindEntry(const VectorsDesc& desc) const
{
    for (const Entry& entry : m_vectors)
    {
        if (entry.desc == &desc)
        {
            return &entry;
        }
    }
    return nullptr;
}

void IndexesBuffer::Set(const std::vector<std::uint32_t>& indexes)
{
    const std::size_t n = std::min(m_indexes.size(), indexes.size());
    std::copy_n(indexes.begin(), n, m_indexes.begin());
}

VectorsBuffer* BufferMgr::AddVectorsBuffer(BufferUsage usage)
{
    m_vectors = CreateVectorsBuffer(usage);
    return m_vectors.get();
}

IndexesBuffer* BufferMgr::AddIndexesBuffer(BufferUsage usage)
{
    m_indexes = CreateIndexesBuffer(usage);
    return m_indexes.get();
}

void BufferMgr::TransferAll()
{
    TransferVectors();
    TransferIndexes();
}

void BufferMgr::TransferVectors()
{
    if (m_vectors)
    {
        m_vectors->Transfer();
    }
}

void BufferMgr::TransferIndexes()
{
    if (m_indexes)
    {
        m_indexes->Transfer();
    }
}
} // namespace canopy::gpu

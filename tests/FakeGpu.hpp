#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "canopy/gpu/Gpu.hpp"

namespace canopy::test
{
// Counters shared by every object a FakeGpu hands out.
struct FakeGpuStats
{
    int programsCompiled = 0;
    int programActivations = 0;
    int buffersCreated = 0;
    int vectorTransfers = 0;
    int indexTransfers = 0;
    int bufferActivations = 0;
    std::vector<std::size_t> drawCounts;
    std::map<std::string, gpu::UniformValue> uniforms;
};

class FakeProgram final : public gpu::Program
{
public:
    FakeProgram(std::string name, FakeGpuStats& stats, bool failCompile)
        : Program(std::move(name)), m_stats(stats), m_failCompile(failCompile)
    {
    }

    [[nodiscard]] bool Compile(std::string* outError) override
    {
        if (m_failCompile)
        {
            if (outError != nullptr)
            {
                *outError = "fake compile failure";
            }
            return false;
        }
        ++m_stats.programsCompiled;
        return true;
    }

    void Activate() override { ++m_stats.programActivations; }

    void SetUniform(const std::string& name, const gpu::UniformValue& value) override
    {
        m_stats.uniforms[name] = value;
    }

private:
    FakeGpuStats& m_stats;
    bool m_failCompile = false;
};

// Keeps a copy of what was last "uploaded" so tests can inspect the GPU side.
class FakeVectorsBuffer final : public gpu::VectorsBuffer
{
public:
    FakeVectorsBuffer(gpu::BufferUsage usage, FakeGpuStats& stats) : VectorsBuffer(usage), m_stats(stats) {}

    void Activate() override { ++m_stats.bufferActivations; }

    void Transfer() override
    {
        ++m_stats.vectorTransfers;
        uploaded = AllData();
        uploadedLen = Len();
    }

    std::vector<float> uploaded;
    std::size_t uploadedLen = 0;

private:
    FakeGpuStats& m_stats;
};

class FakeIndexesBuffer final : public gpu::IndexesBuffer
{
public:
    FakeIndexesBuffer(gpu::BufferUsage usage, FakeGpuStats& stats) : IndexesBuffer(usage), m_stats(stats) {}

    void Activate() override {}

    void Transfer() override
    {
        ++m_stats.indexTransfers;
        uploaded = Data();
    }

    std::vector<std::uint32_t> uploaded;

private:
    FakeGpuStats& m_stats;
};

class FakeBufferMgr final : public gpu::BufferMgr
{
public:
    explicit FakeBufferMgr(FakeGpuStats& stats) : m_stats(stats) {}

    void Activate() override { ++m_stats.bufferActivations; }

    [[nodiscard]] FakeVectorsBuffer* FakeVectors() { return static_cast<FakeVectorsBuffer*>(Vectors()); }
    [[nodiscard]] FakeIndexesBuffer* FakeIndexes() { return static_cast<FakeIndexesBuffer*>(Indexes()); }

protected:
    [[nodiscard]] std::unique_ptr<gpu::VectorsBuffer> CreateVectorsBuffer(gpu::BufferUsage usage) override
    {
        return std::make_unique<FakeVectorsBuffer>(usage, m_stats);
    }

    [[nodiscard]] std::unique_ptr<gpu::IndexesBuffer> CreateIndexesBuffer(gpu::BufferUsage usage) override
    {
        return std::make_unique<FakeIndexesBuffer>(usage, m_stats);
    }

private:
    FakeGpuStats& m_stats;
};

class FakeGpu final : public gpu::Gpu
{
public:
    [[nodiscard]] std::unique_ptr<gpu::Program> NewProgram(const std::string& name) override
    {
        return std::make_unique<FakeProgram>(name, stats, failCompile);
    }

    [[nodiscard]] std::unique_ptr<gpu::BufferMgr> NewBufferMgr() override
    {
        ++stats.buffersCreated;
        return std::make_unique<FakeBufferMgr>(stats);
    }

    void TrianglesIndexed(std::size_t /*start*/, std::size_t count) override
    {
        stats.drawCounts.push_back(count);
    }

    FakeGpuStats stats;
    bool failCompile = false;
};
} // namespace canopy::test

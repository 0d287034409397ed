#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace canopy::core
{
class WorkCounter
{
public:
    explicit WorkCounter(std::size_t initial = 0) : m_count(static_cast<std::ptrdiff_t>(initial)) {}

    void Increment()
    {
        m_count.fetch_add(1, std::memory_order_relaxed);
    }

    void Decrement()
    {
        const auto previous = m_count.fetch_sub(1, std::memory_order_acq_rel);
        if (previous <= 1)
        {
            m_count.notify_all();
        }
    }

    [[nodiscard]] bool IsZero() const
    {
        return m_count.load(std::memory_order_acquire) <= 0;
    }

    void Wait()
    {
        while (true)
        {
            const auto value = m_count.load(std::memory_order_acquire);
            if (value <= 0)
            {
                return;
            }
            m_count.wait(value, std::memory_order_relaxed);
        }
    }

private:
    std::atomic<std::ptrdiff_t> m_count;
};

// Thread pool for CPU-only work such as mesh geometry construction.
// Nothing scheduled here may touch the GPU or the widget tree.
class WorkerPool
{
public:
    using Work = std::function<void()>;

    WorkerPool() = default;
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool Initialize(std::size_t workerCount = 0);
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] std::size_t WorkerCount() const { return m_workers.size(); }

    void Schedule(Work work, std::string_view name = "", WorkCounter* counter = nullptr);

    // Runs func(i) for i in [0, count). Falls back to the calling thread when
    // the pool is not running.
    template <typename Func>
    void ParallelFor(std::size_t count, Func&& func, WorkCounter& counter)
    {
        if (count == 0)
        {
            return;
        }

        using FuncType = std::decay_t<Func>;
        auto sharedFunc = std::make_shared<FuncType>(std::forward<Func>(func));

        if (!m_initialized || m_workers.empty() || count == 1)
        {
            for (std::size_t i = 0; i < count; ++i)
            {
                (*sharedFunc)(i);
            }
            return;
        }

        for (std::size_t i = 0; i < count; ++i)
        {
            Schedule([i, sharedFunc]() { (*sharedFunc)(i); }, "parallel_for", &counter);
        }
    }

    void WaitForAll();

private:
    struct Job
    {
        Work function;
        std::string name;
        WorkCounter* counter = nullptr;
    };

    void WorkerThread();

    std::vector<std::thread> m_workers;
    std::queue<Job> m_jobs;
    std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_completeCondition;

    std::atomic<bool> m_initialized{false};
    std::atomic<bool> m_shutdown{false};
    std::atomic<std::size_t> m_activeJobs{0};
};
} // namespace canopy::core

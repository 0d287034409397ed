#include "canopy/core/WorkerPool.hpp"

#include <exception>
#include <iostream>

namespace canopy::core
{
WorkerPool::~WorkerPool()
{
    Shutdown();
}

bool WorkerPool::Initialize(std::size_t workerCount)
{
    if (m_initialized)
    {
        return true;
    }

    if (workerCount == 0)
    {
        const auto hardware = std::thread::hardware_concurrency();
        workerCount = hardware > 1 ? hardware - 1 : 1;
    }

    m_shutdown = false;
    m_activeJobs = 0;
    m_workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        m_workers.emplace_back(&WorkerPool::WorkerThread, this);
    }

    m_initialized = true;
    std::cout << "[WorkerPool] Initialized with " << workerCount << " workers\n";
    return true;
}

void WorkerPool::Shutdown()
{
    if (!m_initialized)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_shutdown = true;
    }
    m_condition.notify_all();

    for (std::thread& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    m_workers.clear();
    m_initialized = false;
    std::cout << "[WorkerPool] Shutdown complete\n";
}

void WorkerPool::Schedule(Work work, std::string_view name, WorkCounter* counter)
{
    if (!work)
    {
        return;
    }

    if (!m_initialized)
    {
        work();
        return;
    }

    Job job;
    job.function = std::move(work);
    job.name = std::string(name);
    job.counter = counter;

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        if (job.counter != nullptr)
        {
            job.counter->Increment();
        }
        m_jobs.push(std::move(job));
    }
    m_condition.notify_one();
}

void WorkerPool::WaitForAll()
{
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_completeCondition.wait(lock, [this]() { return m_jobs.empty() && m_activeJobs.load() == 0; });
}

void WorkerPool::WorkerThread()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_condition.wait(lock, [this]() { return m_shutdown || !m_jobs.empty(); });
            if (m_jobs.empty())
            {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop();
            ++m_activeJobs;
        }

        try
        {
            job.function();
        }
        catch (const std::exception& e)
        {
            std::cerr << "[WorkerPool] Job '" << job.name << "' threw exception: " << e.what() << "\n";
        }
        catch (...)
        {
            std::cerr << "[WorkerPool] Job '" << job.name << "' threw unknown exception\n";
        }

        if (job.counter != nullptr)
        {
            job.counter->Decrement();
        }

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            --m_activeJobs;
        }
        m_completeCondition.notify_all();
    }
}
} // namespace canopy::core

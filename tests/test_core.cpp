#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "canopy/core/EventBus.hpp"
#include "canopy/core/WorkerPool.hpp"

using namespace canopy::core;

TEST_CASE("Event bus queues until dispatch", "[Core]")
{
    EventBus bus;
    std::vector<InputEventType> seen;
    bus.Subscribe(InputEventType::Key, [&seen](const InputEvent& e) { seen.push_back(e.type); });
    bus.Subscribe(InputEventType::Resize, [&seen](const InputEvent& e) { seen.push_back(e.type); });

    InputEvent key;
    key.type = InputEventType::Key;
    InputEvent resize;
    resize.type = InputEventType::Resize;
    InputEvent move;
    move.type = InputEventType::MouseMove;

    bus.Publish(key);
    bus.Publish(move);
    bus.Publish(resize);
    REQUIRE(bus.PendingCount() == 3);
    REQUIRE(seen.empty());

    bus.DispatchQueued();
    REQUIRE(bus.PendingCount() == 0);
    REQUIRE(seen == std::vector<InputEventType>{InputEventType::Key, InputEventType::Resize});

    SECTION("Events published by a handler wait for the next dispatch")
    {
        bus.Subscribe(InputEventType::MouseMove, [&bus, &key](const InputEvent&) { bus.Publish(key); });
        bus.Publish(move);
        bus.DispatchQueued();
        REQUIRE(bus.PendingCount() == 1);
        bus.DispatchQueued();
        REQUIRE(seen.size() == 3);
    }

    SECTION("Publishing from other threads")
    {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
        {
            threads.emplace_back([&bus, &key]() {
                for (int i = 0; i < 25; ++i)
                {
                    bus.Publish(key);
                }
            });
        }
        for (std::thread& thread : threads)
        {
            thread.join();
        }
        REQUIRE(bus.PendingCount() == 100);
        bus.DispatchQueued();
        REQUIRE(seen.size() == 102);
    }
}

TEST_CASE("Worker pool", "[Core]")
{
    WorkerPool pool;

    SECTION("Runs inline before Initialize")
    {
        int value = 0;
        pool.Schedule([&value]() { value = 7; });
        REQUIRE(value == 7);
        REQUIRE_FALSE(pool.IsInitialized());
    }

    SECTION("ParallelFor visits every index once")
    {
        REQUIRE(pool.Initialize(3));
        REQUIRE(pool.WorkerCount() == 3);
        std::vector<std::atomic<int>> hits(64);
        WorkCounter counter;
        pool.ParallelFor(hits.size(), [&hits](std::size_t i) { hits[i].fetch_add(1); }, counter);
        counter.Wait();
        for (const auto& hit : hits)
        {
            REQUIRE(hit.load() == 1);
        }
        REQUIRE(counter.IsZero());
        pool.Shutdown();
        REQUIRE_FALSE(pool.IsInitialized());
    }

    SECTION("A throwing job does not stop the pool")
    {
        REQUIRE(pool.Initialize(1));
        std::atomic<int> done{0};
        WorkCounter counter;
        pool.Schedule([]() { throw std::runtime_error("boom"); }, "throws", &counter);
        pool.Schedule([]() { throw 42; }, "throws-int", &counter);
        pool.Schedule([&done]() { done = 1; }, "after", &counter);
        counter.Wait();
        pool.WaitForAll();
        REQUIRE(done.load() == 1);
        REQUIRE(counter.IsZero());
    }
}

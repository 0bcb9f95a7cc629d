#include "toonfetch/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

namespace toonfetch {
namespace {

TEST(WorkerPoolTest, RunsEveryTaskOnce) {
    WorkerPool pool(4);
    std::mutex mutex;
    std::multiset<std::size_t> seen;

    pool.run(50, [&](std::size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(i);
    });

    ASSERT_EQ(seen.size(), 50u);
    for (std::size_t i = 0; i < 50; ++i) {
        EXPECT_EQ(seen.count(i), 1u);
    }
}

TEST(WorkerPoolTest, NeverExceedsLimit) {
    WorkerPool pool(3);
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};

    pool.run(20, [&](std::size_t) {
        const int now = ++in_flight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --in_flight;
    });

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    const WorkerPool pool(0);
    EXPECT_EQ(pool.limit(), 1u);
}

TEST(WorkerPoolTest, EmptyRunReturnsImmediately) {
    WorkerPool pool(2);
    bool called = false;
    pool.run(0, [&](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST(WorkerPoolTest, RethrowsAfterRemainingTasksFinish) {
    WorkerPool pool(2);
    std::atomic<int> completed{0};

    EXPECT_THROW(pool.run(10,
                          [&](std::size_t i) {
                              if (i == 3) {
                                  throw std::runtime_error("disk full");
                              }
                              ++completed;
                          }),
                 std::runtime_error);
    EXPECT_EQ(completed.load(), 9);
}

TEST(WorkerPoolTest, FactoryBuildsPoolWithRequestedLimit) {
    const auto pool = makeWorkerPool(5);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->limit(), 5u);

    std::atomic<int> ran{0};
    pool->run(7, [&](std::size_t) { ++ran; });
    EXPECT_EQ(ran.load(), 7);
}

} // namespace
} // namespace toonfetch

#include "toonfetch/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace toonfetch {

WorkerPool::WorkerPool(std::size_t thread_count)
    : thread_count_(std::max<std::size_t>(1, thread_count)) {}

std::unique_ptr<TaskRunner> makeWorkerPool(std::size_t thread_count) {
    return std::make_unique<WorkerPool>(thread_count);
}

void WorkerPool::run(std::size_t count, const std::function<void(std::size_t)>& task) {
    if (count == 0) {
        return;
    }

    std::atomic<std::size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        for (std::size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            try {
                task(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    };

    const std::size_t workers = std::min(thread_count_, count);
    std::vector<std::thread> threads;
    threads.reserve(workers);
    auto joinAll = [&threads]() {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    };

    try {
        for (std::size_t i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
    } catch (...) {
        // Unclaimed tasks are abandoned; running ones finish before we rethrow.
        next.store(count);
        joinAll();
        throw;
    }
    joinAll();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace toonfetch

#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace toonfetch {

// Bounded task pool. run() executes task(0..count-1) with at most limit()
// tasks in flight and returns once all have finished.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    virtual void run(std::size_t count, const std::function<void(std::size_t)>& task) = 0;
    [[nodiscard]] virtual std::size_t limit() const = 0;
};

class WorkerPool final : public TaskRunner {
public:
    explicit WorkerPool(std::size_t thread_count);

    // A throwing task does not stop the others; the first exception is
    // rethrown after every worker has joined. If a thread cannot be started
    // the workers already running drain and join, then std::system_error
    // propagates.
    void run(std::size_t count, const std::function<void(std::size_t)>& task) override;
    [[nodiscard]] std::size_t limit() const override { return thread_count_; }

private:
    std::size_t thread_count_;
};

// Creates the runner for one batch of work given its concurrency limit.
using RunnerFactory = std::function<std::unique_ptr<TaskRunner>(std::size_t)>;

[[nodiscard]] std::unique_ptr<TaskRunner> makeWorkerPool(std::size_t thread_count);

} // namespace toonfetch

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace toonfetch {

// Copies share one flag. Cancelling wakes every waitFor() on any copy.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool isCancelled() const noexcept { return state_->cancelled.load(); }

    // Sleeps for `delay` unless cancelled first. Returns true if cancelled.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> delay) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, delay, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace toonfetch

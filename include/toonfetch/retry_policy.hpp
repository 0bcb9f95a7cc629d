#pragma once

#include <chrono>
#include <string>

namespace toonfetch {

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{500};
    double multiplier{2.0};
    std::chrono::milliseconds max_delay{30000};

    // Wait before attempt `next_attempt` (2-based: the first retry is attempt 2).
    [[nodiscard]] std::chrono::milliseconds delayBefore(int next_attempt) const;
};

enum class FetchState {
    Pending,
    Attempting,
    Succeeded,
    Failed,
};

[[nodiscard]] const char* toString(FetchState state) noexcept;

// Per-page retry bookkeeping: Pending -> Attempting(n) -> Succeeded | Failed.
// Illegal transitions throw std::logic_error.
class FetchStateMachine {
public:
    explicit FetchStateMachine(int max_attempts);

    // Moves to Attempting(n+1). Returns false when the machine has failed or
    // the ceiling is reached.
    bool beginAttempt();
    void succeed();
    // A retryable failure of the current attempt. The machine returns to
    // Pending if attempts remain, otherwise it is Failed.
    void failTransient(std::string reason);
    void failPermanent(std::string reason);

    [[nodiscard]] FetchState state() const noexcept { return state_; }
    [[nodiscard]] int attempts() const noexcept { return attempts_; }
    [[nodiscard]] int maxAttempts() const noexcept { return max_attempts_; }
    [[nodiscard]] bool canRetry() const noexcept { return state_ == FetchState::Pending && attempts_ > 0; }
    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }

private:
    void requireAttempting(const char* transition) const;

    int max_attempts_;
    int attempts_{0};
    FetchState state_{FetchState::Pending};
    std::string last_error_;
};

} // namespace toonfetch

#include "toonfetch/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace toonfetch {

std::chrono::milliseconds RetryPolicy::delayBefore(int next_attempt) const {
    if (next_attempt <= 1) {
        return std::chrono::milliseconds{0};
    }
    const double scaled = static_cast<double>(base_delay.count()) * std::pow(multiplier, next_attempt - 2);
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

const char* toString(FetchState state) noexcept {
    switch (state) {
    case FetchState::Pending:
        return "pending";
    case FetchState::Attempting:
        return "attempting";
    case FetchState::Succeeded:
        return "succeeded";
    case FetchState::Failed:
        return "failed";
    }
    return "unknown";
}

FetchStateMachine::FetchStateMachine(int max_attempts) : max_attempts_(std::max(1, max_attempts)) {}

bool FetchStateMachine::beginAttempt() {
    if (state_ == FetchState::Failed) {
        return false;
    }
    if (state_ != FetchState::Pending) {
        throw std::logic_error(fmt::format("cannot start an attempt from state {}", toString(state_)));
    }
    if (attempts_ >= max_attempts_) {
        state_ = FetchState::Failed;
        return false;
    }
    ++attempts_;
    state_ = FetchState::Attempting;
    return true;
}

void FetchStateMachine::succeed() {
    requireAttempting("succeed");
    state_ = FetchState::Succeeded;
}

void FetchStateMachine::failTransient(std::string reason) {
    requireAttempting("failTransient");
    last_error_ = std::move(reason);
    state_ = attempts_ < max_attempts_ ? FetchState::Pending : FetchState::Failed;
}

void FetchStateMachine::failPermanent(std::string reason) {
    requireAttempting("failPermanent");
    last_error_ = std::move(reason);
    state_ = FetchState::Failed;
}

void FetchStateMachine::requireAttempting(const char* transition) const {
    if (state_ != FetchState::Attempting) {
        throw std::logic_error(fmt::format("{} is only valid while attempting, state is {}",
                                           transition, toString(state_)));
    }
}

} // namespace toonfetch

#include "toonfetch/config.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace toonfetch {

namespace {

constexpr std::size_t kMaxConcurrency = 32;
constexpr int kMaxAttempts = 10;

} // namespace

void validateConfig(const Config& config) {
    if (config.chapter_concurrency == 0 || config.chapter_concurrency > kMaxConcurrency) {
        throw std::invalid_argument(
            fmt::format("chapter concurrency must be between 1 and {}, got {}", kMaxConcurrency,
                        config.chapter_concurrency));
    }
    if (config.page_concurrency == 0 || config.page_concurrency > kMaxConcurrency) {
        throw std::invalid_argument(fmt::format("page concurrency must be between 1 and {}, got {}",
                                                kMaxConcurrency, config.page_concurrency));
    }
    if (config.request_timeout.count() <= 0) {
        throw std::invalid_argument("request timeout must be positive");
    }
    if (config.retry.max_attempts < 1 || config.retry.max_attempts > kMaxAttempts) {
        throw std::invalid_argument(fmt::format("retry attempts must be between 1 and {}, got {}", kMaxAttempts,
                                                config.retry.max_attempts));
    }
    if (config.retry.base_delay.count() < 0 || config.retry.max_delay < config.retry.base_delay ||
        config.retry.multiplier < 1.0) {
        throw std::invalid_argument("retry backoff must be non-negative and non-decreasing");
    }
    if (config.destination.empty()) {
        throw std::invalid_argument("destination directory must not be empty");
    }
    validateSelection(config.selection);
}

FetchOptions fetchOptionsFor(const Config& config) {
    FetchOptions options;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.request_timeout);
    options.retry = config.retry;
    options.headers = {
        {"DNT", "1"},
        {"Accept-Language", "en-US,en;q=0.9"},
    };
    if (!config.referer.empty()) {
        options.headers.emplace_back("Referer", config.referer);
    }
    return options;
}

} // namespace toonfetch

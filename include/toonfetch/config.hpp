#pragma once

#include "catalog.hpp"
#include "image_fetcher.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace toonfetch {

struct Config {
    std::filesystem::path destination{"."};
    std::size_t chapter_concurrency{4};
    std::size_t page_concurrency{4};
    std::chrono::seconds request_timeout{30};
    RetryPolicy retry;
    bool compress{true};
    std::string user_agent{"Mozilla/5.0 (X11; Linux x86_64; rv:75.0) Gecko/20100101 Firefox/75.0"};
    std::string referer{"https://www.webtoons.com/"};
    int verbosity{1};
    bool show_progress{true};
    ChapterSelection selection;
};

// Throws std::invalid_argument naming the offending setting.
void validateConfig(const Config& config);

// Request headers the image hosts expect, plus timeout and retry policy.
[[nodiscard]] FetchOptions fetchOptionsFor(const Config& config);

} // namespace toonfetch

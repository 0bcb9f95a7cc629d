#pragma once

#include "cancellation.hpp"
#include "http_client.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace toonfetch {

struct FetchOptions {
    std::chrono::milliseconds timeout{30000};
    RetryPolicy retry;
    std::vector<std::pair<std::string, std::string>> headers;
};

class ImageFetcher {
public:
    ImageFetcher(HttpClient& client, FetchOptions options);

    // Downloads and validates one page image. Throws PermanentFetchError,
    // TransientFetchError (ceiling exhausted), UnsupportedMediaType or
    // Cancelled. Nothing is written to disk.
    [[nodiscard]] FetchedImage fetch(const PageReference& page, const CancellationToken& cancel) const;

    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] FetchedImage attempt(const PageReference& page, const CancellationToken& cancel) const;

    HttpClient& client_;
    FetchOptions options_;
};

} // namespace toonfetch

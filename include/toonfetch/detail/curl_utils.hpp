#pragma once

#include <curl/curl.h>

#include <memory>

namespace toonfetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

void ensureCurlInitialized();

// Failures that may clear up on their own: timeouts, resets, DNS hiccups.
[[nodiscard]] bool isTransientCurlError(CURLcode code) noexcept;

} // namespace toonfetch::detail

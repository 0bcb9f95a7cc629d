#pragma once

#include <string>
#include <string_view>

namespace toonfetch {

// True for http:// and https:// URLs with a host.
[[nodiscard]] bool isAbsoluteHttpUrl(const std::string& url);

// Removes every `key` parameter from the query string, keeping the rest in
// order. Throws std::invalid_argument if `url` does not parse.
[[nodiscard]] std::string popQueryParam(const std::string& url, std::string_view key);

} // namespace toonfetch

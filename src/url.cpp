#include "toonfetch/url.hpp"

#include "toonfetch/detail/curl_utils.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace toonfetch {

namespace {

using CurlString = std::unique_ptr<char, decltype(&curl_free)>;

detail::CurlUrlHandle parseUrl(const std::string& url) {
    detail::CurlUrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle || curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return {nullptr, &curl_url_cleanup};
    }
    return handle;
}

std::string getPart(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
        return {};
    }
    CurlString value{raw, &curl_free};
    return std::string{value.get()};
}

} // namespace

bool isAbsoluteHttpUrl(const std::string& url) {
    const auto handle = parseUrl(url);
    if (!handle) {
        return false;
    }
    const auto scheme = getPart(handle.get(), CURLUPART_SCHEME);
    return (scheme == "http" || scheme == "https") && !getPart(handle.get(), CURLUPART_HOST).empty();
}

std::string popQueryParam(const std::string& url, std::string_view key) {
    const auto handle = parseUrl(url);
    if (!handle) {
        throw std::invalid_argument("Malformed URL: " + url);
    }

    const auto query = getPart(handle.get(), CURLUPART_QUERY);
    std::string kept;
    std::size_t start = 0;
    while (start <= query.size() && !query.empty()) {
        const auto amp = query.find('&', start);
        const auto pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        const auto name = pair.substr(0, pair.find('='));
        if (!pair.empty() && name != key) {
            if (!kept.empty()) {
                kept.push_back('&');
            }
            kept += pair;
        }
        if (amp == std::string::npos) {
            break;
        }
        start = amp + 1;
    }

    const auto rc = curl_url_set(handle.get(), CURLUPART_QUERY, kept.empty() ? nullptr : kept.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw std::invalid_argument("Cannot rewrite query of URL: " + url);
    }
    return getPart(handle.get(), CURLUPART_URL);
}

} // namespace toonfetch

#pragma once

#include "cancellation.hpp"
#include "types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace toonfetch {

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status{0};
    std::string content_type;
    Bytes body;
};

// A single GET. Transport-level problems are thrown: TransientFetchError for
// timeouts and dropped connections, PermanentFetchError for requests that can
// never succeed, Cancelled when the token fires mid-transfer. HTTP error
// statuses are returned, not thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const HttpRequest& request, const CancellationToken& cancel) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);
    ~CurlHttpClient() override;

    HttpResponse get(const HttpRequest& request, const CancellationToken& cancel) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toonfetch

#include "toonfetch/http_client.hpp"

#include "toonfetch/detail/curl_utils.hpp"
#include "toonfetch/errors.hpp"

#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace toonfetch {

class CurlHttpClient::Impl {
public:
    explicit Impl(std::string user_agent) : user_agent_(std::move(user_agent)) {
        detail::ensureCurlInitialized();
    }

    HttpResponse get(const HttpRequest& request, const CancellationToken& cancel) {
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        if (cancel.isCancelled()) {
            throw Cancelled();
        }

        detail::CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransientFetchError("Failed to allocate curl handle");
        }

        HeaderList headers{nullptr, &curl_slist_free_all};
        for (const auto& [name, value] : request.headers) {
            const auto line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
            if (!appended) {
                throw TransientFetchError("Failed to build request headers");
            }
            headers.release();
            headers.reset(appended);
        }

        HttpResponse response;
        TransferContext ctx{&response.body, &cancel};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_ABORTED_BY_CALLBACK && cancel.isCancelled()) {
            throw Cancelled();
        }
        if (res != CURLE_OK) {
            const auto message = fmt::format("GET {} failed: {}", request.url, curl_easy_strerror(res));
            if (detail::isTransientCurlError(res)) {
                throw TransientFetchError(message);
            }
            throw PermanentFetchError(message);
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        char* content_type = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
            response.content_type = content_type;
        }
        return response;
    }

private:
    struct TransferContext {
        Bytes* body{nullptr};
        const CancellationToken* cancel{nullptr};
    };

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx || !ctx->body) {
            return 0;
        }
        const size_t total = size * nmemb;
        ctx->body->insert(ctx->body->end(), ptr, ptr + total);
        return total;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* ctx = static_cast<TransferContext*>(userdata);
        return (ctx && ctx->cancel && ctx->cancel->isCancelled()) ? 1 : 0;
    }

    std::string user_agent_;
};

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : impl_(std::make_unique<Impl>(std::move(user_agent))) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::get(const HttpRequest& request, const CancellationToken& cancel) {
    return impl_->get(request, cancel);
}

} // namespace toonfetch

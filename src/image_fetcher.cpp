#include "toonfetch/image_fetcher.hpp"

#include "toonfetch/content_type.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/logging.hpp"
#include "toonfetch/url.hpp"

#include <utility>

#include <fmt/format.h>

namespace toonfetch {

ImageFetcher::ImageFetcher(HttpClient& client, FetchOptions options)
    : client_(client), options_(std::move(options)) {}

FetchedImage ImageFetcher::fetch(const PageReference& page, const CancellationToken& cancel) const {
    if (!isAbsoluteHttpUrl(page.url)) {
        throw PermanentFetchError(fmt::format("page {}: not an absolute http(s) URL: '{}'", page.index, page.url));
    }

    FetchStateMachine state(options_.retry.max_attempts);
    while (state.beginAttempt()) {
        if (state.attempts() > 1) {
            const auto delay = options_.retry.delayBefore(state.attempts());
            if (cancel.waitFor(delay)) {
                throw Cancelled();
            }
        }

        try {
            auto image = attempt(page, cancel);
            state.succeed();
            image.attempts = state.attempts();
            return image;
        } catch (const TransientFetchError& ex) {
            state.failTransient(ex.what());
            if (state.canRetry()) {
                log::logger()->warn("page {} attempt {}/{} failed, retrying: {}", page.index, state.attempts(),
                                    state.maxAttempts(), ex.what());
            }
        } catch (const PermanentFetchError& ex) {
            state.failPermanent(ex.what());
            throw;
        } catch (const UnsupportedMediaType& ex) {
            state.failPermanent(ex.what());
            throw;
        }
    }

    throw TransientFetchError(fmt::format("page {}: giving up after {} attempts: {}", page.index, state.attempts(),
                                          state.lastError()));
}

FetchedImage ImageFetcher::attempt(const PageReference& page, const CancellationToken& cancel) const {
    HttpRequest request{page.url, options_.headers, options_.timeout};
    auto response = client_.get(request, cancel);

    if (response.status == 429 || (response.status >= 500 && response.status <= 599)) {
        throw TransientFetchError(fmt::format("GET {} returned HTTP {}", page.url, response.status));
    }
    if (response.status < 200 || response.status > 299) {
        throw PermanentFetchError(fmt::format("GET {} returned HTTP {}", page.url, response.status));
    }
    if (response.body.empty()) {
        throw PermanentFetchError(fmt::format("GET {} returned an empty body", page.url));
    }

    const auto format = resolveFormat(response.content_type, response.body);
    const auto info = decodeImage(response.body, format);

    FetchedImage image;
    image.index = page.index;
    image.bytes = std::move(response.body);
    image.extension = extensionFor(format);
    image.width = info.width;
    image.height = info.height;
    return image;
}

} // namespace toonfetch

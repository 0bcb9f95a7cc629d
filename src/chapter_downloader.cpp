#include "toonfetch/chapter_downloader.hpp"

#include "toonfetch/detail/file_utils.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/logging.hpp"
#include "toonfetch/naming.hpp"
#include "toonfetch/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace toonfetch {

namespace {

void validatePages(const ChapterDescriptor& descriptor, const std::vector<PageReference>& pages) {
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (pages[i].chapter_number != descriptor.number) {
            throw InvalidDescriptor(fmt::format("page {} belongs to chapter {}, not chapter {}", pages[i].index,
                                                pages[i].chapter_number, descriptor.number));
        }
        if (i > 0 && pages[i].index == pages[i - 1].index) {
            throw InvalidDescriptor(
                fmt::format("chapter {} lists page index {} twice", descriptor.number, pages[i].index));
        }
    }
}

PageOutcome failedPage(std::size_t index, PageFailure failure, std::string message) {
    PageOutcome outcome;
    outcome.index = index;
    outcome.failure = failure;
    outcome.error_message = std::move(message);
    return outcome;
}

} // namespace

ChapterDownloader::ChapterDownloader(const ImageFetcher& fetcher, std::size_t page_concurrency,
                                     ProgressListener* listener, RunnerFactory runners)
    : fetcher_(fetcher),
      page_concurrency_(std::max<std::size_t>(1, page_concurrency)),
      listener_(listener),
      runners_(std::move(runners)) {}

ChapterResult ChapterDownloader::download(const ChapterDescriptor& descriptor, std::vector<PageReference> pages,
                                          const std::filesystem::path& staging_dir,
                                          const CancellationToken& cancel) const {
    std::sort(pages.begin(), pages.end(),
              [](const PageReference& a, const PageReference& b) { return a.index < b.index; });
    validatePages(descriptor, pages);

    std::error_code ec;
    std::filesystem::create_directories(staging_dir, ec);
    if (ec) {
        throw ArchiveWriteError(fmt::format("Cannot create staging directory '{}'", staging_dir.string()), ec);
    }

    const std::size_t width = paddingWidth(pages.empty() ? 0 : pages.back().index);

    // One slot per page, each written by exactly one task.
    std::vector<PageOutcome> outcomes(pages.size());
    std::atomic<bool> staging_failed{false};

    const auto pool = runners_(page_concurrency_);
    pool->run(pages.size(), [&](std::size_t slot) {
        const auto& page = pages[slot];
        auto& outcome = outcomes[slot];

        if (cancel.isCancelled()) {
            outcome = failedPage(page.index, PageFailure::Cancelled, "cancelled before start");
        } else if (staging_failed.load()) {
            outcome = failedPage(page.index, PageFailure::Cancelled, "chapter aborted");
        } else {
            try {
                auto image = fetcher_.fetch(page, cancel);

                StagedPage staged;
                staged.index = image.index;
                staged.extension = image.extension;
                staged.entry_name = pageEntryName(image.index, image.extension, width);
                staged.path = staging_dir / staged.entry_name;
                staged.size = image.size();
                staged.width = image.width;
                staged.height = image.height;

                try {
                    detail::writeFile(staged.path, image.bytes.data(), image.bytes.size());
                } catch (const ArchiveWriteError&) {
                    staging_failed.store(true);
                    throw;
                }
                log::logger()->debug("chapter {} page {} staged at {} ({} bytes, {} attempt(s))", descriptor.number,
                                     page.index, staged.path.string(), staged.size, image.attempts);

                outcome.index = page.index;
                outcome.page = std::move(staged);
            } catch (const Cancelled& ex) {
                outcome = failedPage(page.index, PageFailure::Cancelled, ex.what());
            } catch (const TransientFetchError& ex) {
                outcome = failedPage(page.index, PageFailure::Transient, ex.what());
            } catch (const PermanentFetchError& ex) {
                outcome = failedPage(page.index, PageFailure::Permanent, ex.what());
            } catch (const UnsupportedMediaType& ex) {
                outcome = failedPage(page.index, PageFailure::UnsupportedMedia, ex.what());
            }
        }

        if (!outcome.succeeded() && outcome.failure != PageFailure::Cancelled) {
            log::logger()->warn("chapter {} page {} failed: {}", descriptor.number, page.index,
                                outcome.error_message);
        }
        if (listener_) {
            listener_->pageFinished(descriptor.number, page.index, outcome.succeeded());
        }
    });

    ChapterResult result;
    result.descriptor = descriptor;
    result.pages = std::move(outcomes);

    const auto succeeded = static_cast<std::size_t>(
        std::count_if(result.pages.begin(), result.pages.end(), [](const PageOutcome& o) { return o.succeeded(); }));
    if (succeeded == 0) {
        result.status = ChapterStatus::Failed;
    } else if (succeeded < result.pages.size()) {
        result.status = ChapterStatus::PartialFailure;
    } else {
        result.status = ChapterStatus::Success;
    }
    return result;
}

} // namespace toonfetch

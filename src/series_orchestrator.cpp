#include "toonfetch/series_orchestrator.hpp"

#include "toonfetch/archive_builder.hpp"
#include "toonfetch/chapter_downloader.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/image_fetcher.hpp"
#include "toonfetch/logging.hpp"
#include "toonfetch/metadata_writer.hpp"
#include "toonfetch/naming.hpp"
#include "toonfetch/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <new>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace toonfetch {

namespace {

// Staging files live only as long as the chapter that produced them.
class StagingDirectory {
public:
    explicit StagingDirectory(std::filesystem::path path) : path_(std::move(path)) {}
    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    ~StagingDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            log::logger()->warn("could not remove staging directory '{}': {}", path_.string(), ec.message());
        }
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

struct RunState {
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> exhausted{false};
    std::mutex fatal_mutex;
    std::string fatal_message;
};

} // namespace

SeriesOrchestrator::SeriesOrchestrator(HttpClient& client, Config config, ProgressListener* listener, Clock clock,
                                       RunnerFactory runners)
    : client_(client),
      config_(std::move(config)),
      listener_(listener),
      clock_(std::move(clock)),
      runners_(std::move(runners)) {}

std::filesystem::path SeriesOrchestrator::seriesDirectory(const SeriesInfo& series) const {
    return config_.destination / sanitizeFileName(series.title);
}

RunReport SeriesOrchestrator::run(const SeriesInfo& series, const std::vector<ChapterJob>& jobs,
                                  const CancellationToken& cancel) const {
    const auto series_dir = seriesDirectory(series);
    std::error_code ec;
    std::filesystem::create_directories(series_dir, ec);
    if (ec) {
        throw RunFailure(fmt::format("Cannot create series directory '{}': {}", series_dir.string(), ec.message()),
                         0);
    }
    log::logger()->info("series downloading to: {}", series_dir.string());

    const auto staging_root = series_dir / ".toonfetch-staging";
    std::int64_t largest = 0;
    for (const auto& job : jobs) {
        largest = std::max(largest, job.descriptor.number);
    }
    const std::size_t width = paddingWidth(static_cast<std::uint64_t>(largest));

    const ImageFetcher fetcher(client_, fetchOptionsFor(config_));
    const ChapterDownloader downloader(fetcher, config_.page_concurrency, listener_, runners_);

    RunReport report;
    report.chapters.resize(jobs.size());
    RunState state;

    auto markExhausted = [&state](const std::string& message) {
        std::lock_guard<std::mutex> lock(state.fatal_mutex);
        if (!state.exhausted.exchange(true)) {
            state.fatal_message = message;
        }
    };

    auto runChapter = [&](std::size_t slot) {
        const auto& job = jobs[slot];
        auto& outcome = report.chapters[slot];
        outcome.number = job.descriptor.number;

        if (cancel.isCancelled() || state.exhausted.load()) {
            outcome.error_message = cancel.isCancelled() ? "cancelled before start" : "abandoned after fatal error";
            return;
        }
        if (listener_) {
            listener_->chapterStarted(job.descriptor, job.pages.size());
        }

        const auto base = chapterBaseName(job.descriptor.number, width);
        const auto destination = series_dir / (config_.compress ? base + ".cbz" : base);
        try {
            const StagingDirectory staging(staging_root / base);
            const auto result = downloader.download(job.descriptor, job.pages, staging.path(), cancel);
            outcome.status = result.status;
            outcome.failed_pages = result.failedPages();

            if (cancel.isCancelled()) {
                outcome.status = ChapterStatus::Failed;
                outcome.error_message = "cancelled";
            } else if (result.status == ChapterStatus::Failed) {
                outcome.error_message = "no page could be downloaded";
            } else {
                const auto pages = result.succeededPages();
                const auto metadata = MetadataWriter::write(series, job.descriptor, pages, clock_());
                const auto archive = ArchiveBuilder::build(result, metadata, destination, config_.compress);
                outcome.archive = archive.path;
                outcome.saved_pages = pages.size();
                state.completed.fetch_add(1);
            }
        } catch (const InvalidDescriptor& ex) {
            outcome.status = ChapterStatus::Failed;
            outcome.error_message = ex.what();
        } catch (const ArchiveWriteError& ex) {
            outcome.status = ChapterStatus::Failed;
            outcome.error_message = ex.what();
            if (ex.isResourceExhaustion()) {
                markExhausted(ex.what());
            }
        } catch (const std::system_error& ex) {
            // Threads or handles could not be acquired.
            outcome.status = ChapterStatus::Failed;
            outcome.error_message = ex.what();
            markExhausted(ex.what());
        } catch (const std::bad_alloc& ex) {
            outcome.status = ChapterStatus::Failed;
            outcome.error_message = ex.what();
            markExhausted(ex.what());
        } catch (const std::exception& ex) {
            outcome.status = ChapterStatus::Failed;
            outcome.error_message = fmt::format("unexpected error: {}", ex.what());
        }

        if (outcome.status == ChapterStatus::Failed) {
            log::logger()->warn("chapter {} failed: {}", outcome.number, outcome.error_message);
        } else {
            log::logger()->info("chapter {} {}: {} page(s) saved to {}", outcome.number, toString(outcome.status),
                                outcome.saved_pages, outcome.archive ? outcome.archive->string() : "-");
        }
        if (listener_) {
            listener_->chapterFinished(outcome);
        }
    };

    try {
        const auto pool = runners_(config_.chapter_concurrency);
        pool->run(jobs.size(), runChapter);
    } catch (const std::system_error& ex) {
        markExhausted(ex.what());
    }

    if (!std::filesystem::remove(staging_root, ec) && ec) {
        log::logger()->debug("staging root '{}' left in place: {}", staging_root.string(), ec.message());
    }

    if (state.exhausted.load()) {
        throw RunFailure(fmt::format("Run aborted, local resources exhausted: {}", state.fatal_message),
                         state.completed.load());
    }

    for (const auto& outcome : report.chapters) {
        switch (outcome.status) {
        case ChapterStatus::Success:
            ++report.succeeded;
            break;
        case ChapterStatus::PartialFailure:
            ++report.partial;
            break;
        case ChapterStatus::Failed:
            ++report.failed;
            break;
        }
    }
    return report;
}

} // namespace toonfetch

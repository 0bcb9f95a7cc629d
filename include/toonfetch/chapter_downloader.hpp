#pragma once

#include "cancellation.hpp"
#include "image_fetcher.hpp"
#include "progress.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace toonfetch {

class ChapterDownloader {
public:
    ChapterDownloader(const ImageFetcher& fetcher, std::size_t page_concurrency,
                      ProgressListener* listener = nullptr, RunnerFactory runners = &makeWorkerPool);

    // Fetches every page with at most page_concurrency requests in flight and
    // stages each image as <staging_dir>/<padded index>.<ext>. Page failures
    // are recorded in the result, never thrown. Throws InvalidDescriptor for
    // inconsistent page references and ArchiveWriteError if staging fails.
    [[nodiscard]] ChapterResult download(const ChapterDescriptor& descriptor, std::vector<PageReference> pages,
                                         const std::filesystem::path& staging_dir,
                                         const CancellationToken& cancel) const;

private:
    const ImageFetcher& fetcher_;
    std::size_t page_concurrency_;
    ProgressListener* listener_;
    RunnerFactory runners_;
};

} // namespace toonfetch

#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <vector>

namespace toonfetch {

class SeriesOrchestrator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // `runners` builds the chapter pool and one page pool per chapter.
    SeriesOrchestrator(HttpClient& client, Config config, ProgressListener* listener = nullptr,
                       Clock clock = &std::chrono::system_clock::now, RunnerFactory runners = &makeWorkerPool);

    // Downloads and archives every job, at most chapter_concurrency chapters
    // at a time. One chapter's failure never stops the others. Throws
    // RunFailure when the series directory cannot be created or the disk runs
    // out of space or file handles.
    [[nodiscard]] RunReport run(const SeriesInfo& series, const std::vector<ChapterJob>& jobs,
                                const CancellationToken& cancel) const;

    [[nodiscard]] std::filesystem::path seriesDirectory(const SeriesInfo& series) const;

private:
    HttpClient& client_;
    Config config_;
    ProgressListener* listener_;
    Clock clock_;
    RunnerFactory runners_;
};

} // namespace toonfetch

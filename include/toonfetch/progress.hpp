#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace toonfetch {

struct ChapterProgress {
    std::int64_t number{0};
    std::string title;
    std::size_t total_pages{0};
    std::size_t finished_pages{0};
    std::size_t failed_pages{0};
    bool is_running{false};
    bool is_done{false};
    ChapterStatus status{ChapterStatus::Failed};
    std::string error_message;
};

// Receives events from worker threads; implementations synchronise themselves.
class ProgressListener {
public:
    virtual ~ProgressListener() = default;

    virtual void chapterStarted(const ChapterDescriptor& chapter, std::size_t total_pages) = 0;
    virtual void pageFinished(std::int64_t chapter, std::size_t page_index, bool succeeded) = 0;
    virtual void chapterFinished(const ChapterOutcome& outcome) = 0;
};

} // namespace toonfetch

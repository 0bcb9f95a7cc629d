#pragma once

#include "progress.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace toonfetch {

// Redraws a chapter progress panel in place until stop() is called.
class ProgressPanel final : public ProgressListener {
public:
    explicit ProgressPanel(std::ostream& out);
    ~ProgressPanel() override;

    void start(std::size_t total_chapters);
    void stop();

    void chapterStarted(const ChapterDescriptor& chapter, std::size_t total_pages) override;
    void pageFinished(std::int64_t chapter, std::size_t page_index, bool succeeded) override;
    void chapterFinished(const ChapterOutcome& outcome) override;

    [[nodiscard]] std::string buildPanel() const;
    [[nodiscard]] static std::string formatChapterLine(const ChapterProgress& progress);

private:
    void renderLoop();
    void redrawPanel(const std::string& panel, std::size_t& previous_lines);

    std::ostream& out_;
    std::thread render_thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    mutable std::mutex state_mutex_;
    std::map<std::int64_t, ChapterProgress> chapters_;
    std::size_t total_chapters_{0};
    std::size_t finished_chapters_{0};
    std::size_t failed_chapters_{0};
};

} // namespace toonfetch

#include "toonfetch/progress_panel.hpp"

#include <algorithm>
#include <chrono>
#include <ostream>

#include <fmt/format.h>

namespace toonfetch {

namespace {

constexpr int kBarWidth = 30;
constexpr std::size_t kMaxTitleWidth = 24;

// Keeps at most `limit` code points without splitting a multi-byte sequence.
std::string truncateUtf8(const std::string& text, std::size_t limit) {
    std::size_t code_points = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80 && code_points++ == limit) {
            return text.substr(0, i);
        }
    }
    return text;
}

std::string renderBar(double ratio) {
    const int bar_pos = static_cast<int>(ratio * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

ProgressPanel::ProgressPanel(std::ostream& out) : out_(out) {}

ProgressPanel::~ProgressPanel() { stop(); }

void ProgressPanel::start(std::size_t total_chapters) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        total_chapters_ = total_chapters;
    }
    if (running_.exchange(true)) {
        return;
    }
    render_thread_ = std::thread([this]() { renderLoop(); });
}

void ProgressPanel::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();
    if (render_thread_.joinable()) {
        render_thread_.join();
    }
}

void ProgressPanel::chapterStarted(const ChapterDescriptor& chapter, std::size_t total_pages) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& progress = chapters_[chapter.number];
    progress.number = chapter.number;
    progress.title = chapter.title;
    progress.total_pages = total_pages;
    progress.is_running = true;
}

void ProgressPanel::pageFinished(std::int64_t chapter, std::size_t, bool succeeded) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& progress = chapters_[chapter];
    ++progress.finished_pages;
    if (!succeeded) {
        ++progress.failed_pages;
    }
}

void ProgressPanel::chapterFinished(const ChapterOutcome& outcome) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto& progress = chapters_[outcome.number];
    progress.number = outcome.number;
    progress.is_running = false;
    progress.is_done = true;
    progress.status = outcome.status;
    progress.error_message = outcome.error_message;
    progress.failed_pages = outcome.failed_pages.size();
    ++finished_chapters_;
    if (outcome.status == ChapterStatus::Failed) {
        ++failed_chapters_;
    }
}

void ProgressPanel::renderLoop() {
    std::size_t previous_lines = 0;
    for (;;) {
        redrawPanel(buildPanel(), previous_lines);

        std::unique_lock<std::mutex> lock(wake_mutex_);
        if (wake_cv_.wait_for(lock, std::chrono::milliseconds(200), [this] { return !running_.load(); })) {
            break;
        }
    }

    redrawPanel(buildPanel(), previous_lines);
    out_ << std::flush;
}

std::string ProgressPanel::buildPanel() const {
    std::lock_guard<std::mutex> lock(state_mutex_);

    std::string panel;
    panel.reserve(chapters_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("toonfetch ({} chapters)\n", total_chapters_);
    panel.append("--------------------------------------------------\n");

    for (const auto& [number, progress] : chapters_) {
        if (progress.is_running || (progress.is_done && progress.status != ChapterStatus::Success)) {
            panel += formatChapterLine(progress);
            panel.push_back('\n');
        }
    }

    panel.append("--------------------------------------------------\n");
    if (total_chapters_ > 0) {
        const double ratio = static_cast<double>(finished_chapters_) / static_cast<double>(total_chapters_);
        panel += fmt::format("Overall: [{}] {}/{} chapters", renderBar(ratio), finished_chapters_, total_chapters_);
        if (failed_chapters_ > 0) {
            panel += fmt::format(", {} failed", failed_chapters_);
        }
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");

    return panel;
}

std::string ProgressPanel::formatChapterLine(const ChapterProgress& progress) {
    const std::string display_name =
        truncateUtf8(fmt::format("#{} {}", progress.number, progress.title), kMaxTitleWidth);

    std::string line;
    line.reserve(256);
    if (progress.total_pages > 0) {
        const double ratio =
            static_cast<double>(progress.finished_pages) / static_cast<double>(progress.total_pages);
        line += fmt::format("{:<{}} [{}] {:>3}% ({}/{} pages)", display_name, kMaxTitleWidth, renderBar(ratio),
                            static_cast<int>(ratio * 100.0), progress.finished_pages, progress.total_pages);
    } else {
        line += fmt::format("{:<{}} [Waiting...]", display_name, kMaxTitleWidth);
    }

    if (progress.is_done) {
        switch (progress.status) {
        case ChapterStatus::Success:
            line.append(u8"  ✅ Done");
            break;
        case ChapterStatus::PartialFailure:
            line += fmt::format(u8"  ⚠️ {} page(s) missing", progress.failed_pages);
            break;
        case ChapterStatus::Failed:
            line += fmt::format(u8"  ❌ {}", progress.error_message);
            break;
        }
    } else if (progress.failed_pages > 0) {
        line += fmt::format("  {} failed", progress.failed_pages);
    }
    return line;
}

void ProgressPanel::redrawPanel(const std::string& panel, std::size_t& previous_lines) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel;
    previous_lines = current_lines;
}

} // namespace toonfetch

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toonfetch {

using Bytes = std::vector<std::uint8_t>;

struct SeriesInfo {
    std::string title;
    std::string description;
    std::string author;
    std::vector<std::string> genres;
    std::string url;
};

struct ReleaseDate {
    int year{0};
    int month{0};
    int day{0};
};

// Gregorian calendar check, leap years included.
[[nodiscard]] bool isValidDate(const ReleaseDate& date) noexcept;

struct ChapterDescriptor {
    std::string series_title;
    std::int64_t number{0};
    std::string title;
    std::string url;
    std::optional<ReleaseDate> released;
};

struct PageReference {
    std::int64_t chapter_number{0};
    std::size_t index{0};
    std::string url;
    // Dimension hints from the catalog; the decoded image wins.
    std::uint32_t width{0};
    std::uint32_t height{0};
};

struct ChapterJob {
    ChapterDescriptor descriptor;
    std::vector<PageReference> pages;
};

struct FetchedImage {
    std::size_t index{0};
    Bytes bytes;
    std::string extension;
    std::uint32_t width{0};
    std::uint32_t height{0};
    int attempts{0};

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

struct StagedPage {
    std::size_t index{0};
    std::filesystem::path path;
    std::string entry_name;
    std::string extension;
    std::uint64_t size{0};
    std::uint32_t width{0};
    std::uint32_t height{0};
};

enum class PageFailure {
    None,
    Transient,
    Permanent,
    UnsupportedMedia,
    Cancelled,
};

struct PageOutcome {
    std::size_t index{0};
    std::optional<StagedPage> page;
    PageFailure failure{PageFailure::None};
    std::string error_message;

    [[nodiscard]] bool succeeded() const noexcept { return page.has_value(); }
};

enum class ChapterStatus {
    Success,
    PartialFailure,
    Failed,
};

[[nodiscard]] const char* toString(ChapterStatus status) noexcept;
[[nodiscard]] const char* toString(PageFailure failure) noexcept;

struct ChapterResult {
    ChapterDescriptor descriptor;
    std::vector<PageOutcome> pages;
    ChapterStatus status{ChapterStatus::Failed};

    [[nodiscard]] std::vector<StagedPage> succeededPages() const;
    [[nodiscard]] std::vector<std::size_t> failedPages() const;
};

struct Archive {
    std::filesystem::path path;
    bool compressed{false};
    std::size_t entries{0};
};

struct ChapterOutcome {
    std::int64_t number{0};
    ChapterStatus status{ChapterStatus::Failed};
    std::vector<std::size_t> failed_pages;
    std::size_t saved_pages{0};
    std::optional<std::filesystem::path> archive;
    std::string error_message;
};

struct RunReport {
    std::vector<ChapterOutcome> chapters;
    std::size_t succeeded{0};
    std::size_t partial{0};
    std::size_t failed{0};

    [[nodiscard]] bool allSucceeded() const noexcept { return partial == 0 && failed == 0; }
};

} // namespace toonfetch

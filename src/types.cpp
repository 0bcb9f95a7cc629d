#include "toonfetch/types.hpp"

namespace toonfetch {

bool isValidDate(const ReleaseDate& date) noexcept {
    constexpr int days_in_month[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (date.year < 1 || date.month < 1 || date.month > 12 || date.day < 1) {
        return false;
    }
    const bool leap = (date.year % 4 == 0 && date.year % 100 != 0) || date.year % 400 == 0;
    const int limit = (date.month == 2 && !leap) ? 28 : days_in_month[date.month - 1];
    return date.day <= limit;
}

const char* toString(ChapterStatus status) noexcept {
    switch (status) {
    case ChapterStatus::Success:
        return "success";
    case ChapterStatus::PartialFailure:
        return "partial";
    case ChapterStatus::Failed:
        return "failed";
    }
    return "unknown";
}

const char* toString(PageFailure failure) noexcept {
    switch (failure) {
    case PageFailure::None:
        return "none";
    case PageFailure::Transient:
        return "transient";
    case PageFailure::Permanent:
        return "permanent";
    case PageFailure::UnsupportedMedia:
        return "unsupported media";
    case PageFailure::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::vector<StagedPage> ChapterResult::succeededPages() const {
    std::vector<StagedPage> staged;
    staged.reserve(pages.size());
    for (const auto& outcome : pages) {
        if (outcome.page) {
            staged.push_back(*outcome.page);
        }
    }
    return staged;
}

std::vector<std::size_t> ChapterResult::failedPages() const {
    std::vector<std::size_t> failed;
    for (const auto& outcome : pages) {
        if (!outcome.page) {
            failed.push_back(outcome.index);
        }
    }
    return failed;
}

} // namespace toonfetch

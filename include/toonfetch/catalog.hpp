#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toonfetch {

// Source of chapter descriptors and page URLs. Implementations validate their
// input once; everything they hand out is already well-formed.
class Catalog {
public:
    virtual ~Catalog() = default;

    [[nodiscard]] virtual const SeriesInfo& series() const = 0;
    // Ascending by chapter number, pages ascending by index.
    [[nodiscard]] virtual const std::vector<ChapterJob>& chapters() const = 0;
};

// Catalog read from a JSON manifest produced by a site scraper.
class ManifestCatalog final : public Catalog {
public:
    // Both throw InvalidDescriptor describing the first problem found.
    [[nodiscard]] static ManifestCatalog fromFile(const std::filesystem::path& path);
    [[nodiscard]] static ManifestCatalog parse(const std::string& text);

    [[nodiscard]] const SeriesInfo& series() const override { return series_; }
    [[nodiscard]] const std::vector<ChapterJob>& chapters() const override { return chapters_; }

private:
    ManifestCatalog(SeriesInfo series, std::vector<ChapterJob> chapters);

    SeriesInfo series_;
    std::vector<ChapterJob> chapters_;
};

struct ChapterSelection {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> end;
    bool latest_only{false};
};

// Throws std::invalid_argument for contradictory selections.
void validateSelection(const ChapterSelection& selection);

// Keeps the chapters inside [start, end], or only the newest one.
[[nodiscard]] std::vector<ChapterJob> selectChapters(const std::vector<ChapterJob>& chapters,
                                                     const ChapterSelection& selection);

} // namespace toonfetch

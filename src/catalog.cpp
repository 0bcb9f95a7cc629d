#include "toonfetch/catalog.hpp"

#include "toonfetch/errors.hpp"
#include "toonfetch/url.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace toonfetch {

namespace {

using json = nlohmann::json;

std::string requireString(const json& object, const char* key, const std::string& where) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw InvalidDescriptor(fmt::format("{}: '{}' must be a non-empty string", where, key));
    }
    return it->get<std::string>();
}

std::string optionalString(const json& object, const char* key, const std::string& where) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw InvalidDescriptor(fmt::format("{}: '{}' must be a string", where, key));
    }
    return it->get<std::string>();
}

std::uint32_t optionalDimension(const json& object, const char* key, const std::string& where) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number()) {
        throw InvalidDescriptor(fmt::format("{}: '{}' must be a number", where, key));
    }
    const double value = it->get<double>();
    if (value < 0 || value > 1e6) {
        throw InvalidDescriptor(fmt::format("{}: '{}' is out of range", where, key));
    }
    // Catalog sites report fractional sizes; round up like the viewer does.
    const auto whole = static_cast<std::uint32_t>(value);
    return static_cast<double>(whole) < value ? whole + 1 : whole;
}

std::optional<ReleaseDate> parseReleaseDate(const json& chapter, const std::string& where) {
    const auto text = optionalString(chapter, "released", where);
    if (text.empty()) {
        return std::nullopt;
    }
    ReleaseDate date;
    char trailing = 0;
    if (text.size() != 10 ||
        std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &date.year, &date.month, &date.day, &trailing) != 3) {
        throw InvalidDescriptor(fmt::format("{}: 'released' must be YYYY-MM-DD, got '{}'", where, text));
    }
    if (!isValidDate(date)) {
        throw InvalidDescriptor(fmt::format("{}: 'released' is not a calendar date: '{}'", where, text));
    }
    return date;
}

SeriesInfo parseSeries(const json& root) {
    const auto it = root.find("series");
    if (it == root.end() || !it->is_object()) {
        throw InvalidDescriptor("manifest: 'series' must be an object");
    }
    const auto& node = *it;
    const std::string where = "series";

    SeriesInfo series;
    series.title = requireString(node, "title", where);
    series.description = optionalString(node, "description", where);
    series.author = optionalString(node, "author", where);
    series.url = optionalString(node, "url", where);

    const auto genres = node.find("genres");
    if (genres != node.end() && !genres->is_null()) {
        if (!genres->is_array()) {
            throw InvalidDescriptor("series: 'genres' must be an array of strings");
        }
        for (const auto& genre : *genres) {
            if (!genre.is_string()) {
                throw InvalidDescriptor("series: 'genres' must be an array of strings");
            }
            series.genres.push_back(genre.get<std::string>());
        }
    }
    return series;
}

std::vector<PageReference> parsePages(const json& chapter, std::int64_t number, const std::string& where) {
    const auto it = chapter.find("pages");
    if (it == chapter.end() || !it->is_array()) {
        throw InvalidDescriptor(fmt::format("{}: 'pages' must be an array", where));
    }

    std::vector<PageReference> pages;
    std::set<std::size_t> seen;
    std::size_t position = 0;
    for (const auto& node : *it) {
        const std::string page_where = fmt::format("{} page #{}", where, position);
        if (!node.is_object()) {
            throw InvalidDescriptor(fmt::format("{}: must be an object", page_where));
        }

        PageReference page;
        page.chapter_number = number;
        page.index = position;
        const auto index = node.find("index");
        if (index != node.end() && !index->is_null()) {
            if (!index->is_number_unsigned()) {
                throw InvalidDescriptor(fmt::format("{}: 'index' must be a non-negative integer", page_where));
            }
            page.index = index->get<std::size_t>();
        }
        if (!seen.insert(page.index).second) {
            throw InvalidDescriptor(fmt::format("{}: duplicate page index {}", where, page.index));
        }

        page.url = requireString(node, "url", page_where);
        if (!isAbsoluteHttpUrl(page.url)) {
            throw InvalidDescriptor(fmt::format("{}: '{}' is not an absolute http(s) URL", page_where, page.url));
        }
        page.width = optionalDimension(node, "width", page_where);
        page.height = optionalDimension(node, "height", page_where);

        pages.push_back(std::move(page));
        ++position;
    }

    std::sort(pages.begin(), pages.end(),
              [](const PageReference& a, const PageReference& b) { return a.index < b.index; });
    return pages;
}

std::vector<ChapterJob> parseChapters(const json& root, const SeriesInfo& series) {
    const auto it = root.find("chapters");
    if (it == root.end() || !it->is_array()) {
        throw InvalidDescriptor("manifest: 'chapters' must be an array");
    }

    std::vector<ChapterJob> jobs;
    std::set<std::int64_t> seen;
    std::size_t position = 0;
    for (const auto& node : *it) {
        std::string where = fmt::format("chapter #{}", position++);
        if (!node.is_object()) {
            throw InvalidDescriptor(fmt::format("{}: must be an object", where));
        }
        const auto number = node.find("number");
        if (number == node.end() || !number->is_number_integer() || number->get<std::int64_t>() < 0) {
            throw InvalidDescriptor(fmt::format("{}: 'number' must be a non-negative integer", where));
        }

        ChapterJob job;
        job.descriptor.series_title = series.title;
        job.descriptor.number = number->get<std::int64_t>();
        where = fmt::format("chapter {}", job.descriptor.number);
        if (!seen.insert(job.descriptor.number).second) {
            throw InvalidDescriptor(fmt::format("{}: listed more than once", where));
        }
        job.descriptor.title = optionalString(node, "title", where);
        job.descriptor.url = optionalString(node, "url", where);
        job.descriptor.released = parseReleaseDate(node, where);
        job.pages = parsePages(node, job.descriptor.number, where);
        jobs.push_back(std::move(job));
    }

    std::sort(jobs.begin(), jobs.end(), [](const ChapterJob& a, const ChapterJob& b) {
        return a.descriptor.number < b.descriptor.number;
    });
    return jobs;
}

} // namespace

ManifestCatalog::ManifestCatalog(SeriesInfo series, std::vector<ChapterJob> chapters)
    : series_(std::move(series)), chapters_(std::move(chapters)) {}

ManifestCatalog ManifestCatalog::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidDescriptor(fmt::format("cannot open manifest '{}'", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

ManifestCatalog ManifestCatalog::parse(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw InvalidDescriptor(fmt::format("manifest is not valid JSON: {}", ex.what()));
    }
    if (!root.is_object()) {
        throw InvalidDescriptor("manifest: top level must be an object");
    }

    auto series = parseSeries(root);
    auto chapters = parseChapters(root, series);
    return ManifestCatalog(std::move(series), std::move(chapters));
}

void validateSelection(const ChapterSelection& selection) {
    if (selection.latest_only && (selection.start || selection.end)) {
        throw std::invalid_argument("--latest cannot be combined with --start or --end");
    }
    if (selection.start && selection.end && *selection.end < *selection.start) {
        throw std::invalid_argument(
            fmt::format("--end ({}) must not be less than --start ({})", *selection.end, *selection.start));
    }
}

std::vector<ChapterJob> selectChapters(const std::vector<ChapterJob>& chapters, const ChapterSelection& selection) {
    validateSelection(selection);
    if (chapters.empty()) {
        return {};
    }
    if (selection.latest_only) {
        const auto latest = std::max_element(chapters.begin(), chapters.end(),
                                             [](const ChapterJob& a, const ChapterJob& b) {
                                                 return a.descriptor.number < b.descriptor.number;
                                             });
        return {*latest};
    }

    std::vector<ChapterJob> selected;
    for (const auto& job : chapters) {
        const auto number = job.descriptor.number;
        if (selection.start && number < *selection.start) {
            continue;
        }
        if (selection.end && number > *selection.end) {
            continue;
        }
        selected.push_back(job);
    }
    return selected;
}

} // namespace toonfetch

#include "toonfetch/metadata_writer.hpp"

#include "toonfetch/errors.hpp"

#include <ctime>

#include <fmt/format.h>
#include <pugixml.hpp>

namespace toonfetch {

namespace {

// Collects the serialised document straight into the output buffer.
class BytesWriter final : public pugi::xml_writer {
public:
    explicit BytesWriter(Bytes& out) : out_(out) {}

    void write(const void* data, size_t size) override {
        const auto* bytes = static_cast<const std::uint8_t*>(data);
        out_.insert(out_.end(), bytes, bytes + size);
    }

private:
    Bytes& out_;
};

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec);
}

// XML 1.0 has no representation for C0 controls other than tab, LF and CR,
// not even as character references.
std::string xmlSafe(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 || c == '\t' || c == '\n' || c == '\r') {
            cleaned.push_back(c);
        }
    }
    return cleaned;
}

void element(pugi::xml_node parent, const char* name, const std::string& value) {
    parent.append_child(name).text().set(xmlSafe(value).c_str());
}

} // namespace

Bytes MetadataWriter::write(const SeriesInfo& series, const ChapterDescriptor& chapter,
                            const std::vector<StagedPage>& pages,
                            std::chrono::system_clock::time_point generated_at) {
    const std::string& series_title = series.title.empty() ? chapter.series_title : series.title;
    if (series_title.empty()) {
        throw InvalidDescriptor(fmt::format("chapter {} has no series title", chapter.number));
    }
    if (chapter.number < 0) {
        throw InvalidDescriptor(fmt::format("chapter number {} is negative", chapter.number));
    }
    if (chapter.released && !isValidDate(*chapter.released)) {
        throw InvalidDescriptor(fmt::format("chapter {} has an invalid release date {}-{}-{}", chapter.number,
                                            chapter.released->year, chapter.released->month,
                                            chapter.released->day));
    }

    std::string genres;
    for (const auto& genre : series.genres) {
        if (!genres.empty()) {
            genres.push_back(',');
        }
        genres += genre;
    }

    pugi::xml_document doc;
    auto declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("ComicInfo");
    root.append_attribute("xmlns:xsi") = "http://www.w3.org/2001/XMLSchema-instance";
    root.append_attribute("xmlns:xsd") = "http://www.w3.org/2001/XMLSchema";

    element(root, "Title", chapter.title);
    element(root, "Series", series_title);
    element(root, "Number", std::to_string(chapter.number));
    element(root, "Summary", series.description);
    if (chapter.released) {
        element(root, "Year", std::to_string(chapter.released->year));
        element(root, "Month", std::to_string(chapter.released->month));
        element(root, "Day", std::to_string(chapter.released->day));
    }
    element(root, "Writer", series.author);
    element(root, "Genre", genres);
    element(root, "PageCount", std::to_string(pages.size()));
    element(root, "BlackAndWhite", "No");
    element(root, "Manga", "No");
    element(root, "Web", chapter.url);
    element(root, "Notes", "Generated by toonfetch at " + isoTimestamp(generated_at));

    auto pages_node = root.append_child("Pages");
    for (std::size_t i = 0; i < pages.size(); ++i) {
        const auto& page = pages[i];
        auto node = pages_node.append_child("Page");
        node.append_attribute("Image") = static_cast<unsigned long long>(i);
        node.append_attribute("Type") = page.index == 0 ? "FrontCover" : "Story";
        node.append_attribute("ImageSize") = static_cast<unsigned long long>(page.size);
        node.append_attribute("ImageWidth") = page.width;
        node.append_attribute("ImageHeight") = page.height;
        node.append_attribute("Key") = xmlSafe(page.entry_name).c_str();
    }

    Bytes out;
    BytesWriter writer(out);
    doc.save(writer, "  ", pugi::format_default, pugi::encoding_utf8);
    return out;
}

} // namespace toonfetch

#pragma once

#include "types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace toonfetch {

// Builds the ComicInfo.xml document embedded in every chapter archive.
class MetadataWriter {
public:
    static constexpr const char* kFileName = "ComicInfo.xml";

    // `pages` are the successfully staged pages in archive order. Output is
    // byte-identical for identical arguments. Throws InvalidDescriptor.
    [[nodiscard]] static Bytes write(const SeriesInfo& series, const ChapterDescriptor& chapter,
                                     const std::vector<StagedPage>& pages,
                                     std::chrono::system_clock::time_point generated_at);
};

} // namespace toonfetch

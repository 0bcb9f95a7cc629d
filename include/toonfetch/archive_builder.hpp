#pragma once

#include "types.hpp"

#include <filesystem>

namespace toonfetch {

class ArchiveBuilder {
public:
    // Packages the successful pages of `result` in ascending order plus the
    // metadata document. compress=true writes a zip container at
    // `destination`, otherwise a directory. The output is built beside
    // `destination` and renamed into place, replacing any previous archive
    // wholesale; on failure nothing is left behind. Throws ArchiveWriteError.
    [[nodiscard]] static Archive build(const ChapterResult& result, const Bytes& metadata,
                                       const std::filesystem::path& destination, bool compress);
};

} // namespace toonfetch

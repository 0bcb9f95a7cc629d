#pragma once

#include "toonfetch/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace toonfetch::test {

struct CbzEntry {
    std::string name;
    Bytes data;
};

// Reads every entry of a zip container in stored order. Throws
// std::runtime_error when libarchive rejects the file.
[[nodiscard]] std::vector<CbzEntry> readCbz(const std::filesystem::path& path);

} // namespace toonfetch::test

#pragma once

#include "toonfetch/types.hpp"

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string_view>

namespace toonfetch::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// All helpers throw ArchiveWriteError carrying errno on failure.
[[nodiscard]] FilePtr openFile(const std::filesystem::path& path, const char* mode);
void writeAll(FILE* file, const void* data, std::size_t size, const std::filesystem::path& path);
void closeFile(FilePtr file, const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const void* data, std::size_t size);
[[nodiscard]] Bytes readFile(const std::filesystem::path& path);

// Unique sibling name for building `target` out of place.
[[nodiscard]] std::filesystem::path temporarySibling(const std::filesystem::path& target, std::string_view tag);

} // namespace toonfetch::detail

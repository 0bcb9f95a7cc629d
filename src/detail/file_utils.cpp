#include "toonfetch/detail/file_utils.hpp"

#include "toonfetch/errors.hpp"

#include <atomic>
#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <unistd.h>

namespace toonfetch::detail {

namespace {

[[noreturn]] void throwErrno(const char* what, const std::filesystem::path& path) {
    const int err = errno != 0 ? errno : EIO;
    throw ArchiveWriteError(fmt::format("{} '{}'", what, path.string()), std::error_code(err, std::generic_category()));
}

} // namespace

FilePtr openFile(const std::filesystem::path& path, const char* mode) {
    errno = 0;
    FilePtr file{std::fopen(path.c_str(), mode)};
    if (!file) {
        throwErrno("Cannot open", path);
    }
    return file;
}

void writeAll(FILE* file, const void* data, std::size_t size, const std::filesystem::path& path) {
    errno = 0;
    if (size > 0 && std::fwrite(data, 1, size, file) != size) {
        throwErrno("Failed to write", path);
    }
}

void closeFile(FilePtr file, const std::filesystem::path& path) {
    errno = 0;
    if (std::fflush(file.get()) != 0) {
        throwErrno("Failed to flush", path);
    }
    if (std::fclose(file.release()) != 0) {
        throwErrno("Failed to close", path);
    }
}

void writeFile(const std::filesystem::path& path, const void* data, std::size_t size) {
    auto file = openFile(path, "wb");
    writeAll(file.get(), data, size, path);
    closeFile(std::move(file), path);
}

Bytes readFile(const std::filesystem::path& path) {
    auto file = openFile(path, "rb");
    Bytes contents;
    std::uint8_t buffer[64 * 1024];
    for (;;) {
        errno = 0;
        const std::size_t got = std::fread(buffer, 1, sizeof(buffer), file.get());
        contents.insert(contents.end(), buffer, buffer + got);
        if (got < sizeof(buffer)) {
            if (std::ferror(file.get())) {
                throwErrno("Failed to read", path);
            }
            break;
        }
    }
    return contents;
}

std::filesystem::path temporarySibling(const std::filesystem::path& target, std::string_view tag) {
    static std::atomic<unsigned> counter{0};
    auto name = fmt::format(".{}.{}-{}-{}", target.filename().string(), tag, ::getpid(), counter.fetch_add(1));
    return target.parent_path() / name;
}

} // namespace toonfetch::detail

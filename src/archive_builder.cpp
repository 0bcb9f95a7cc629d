#include "toonfetch/archive_builder.hpp"

#include "toonfetch/detail/file_utils.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/logging.hpp"
#include "toonfetch/metadata_writer.hpp"

#include <cerrno>
#include <ctime>
#include <memory>
#include <system_error>

#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>

namespace toonfetch {

namespace {

void removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        log::logger()->warn("could not remove '{}': {}", path.string(), ec.message());
    }
}

// 1980-01-01T00:00:00Z, the zip epoch; keeps identical chapters byte-identical.
constexpr std::time_t kEntryTime = 315532800;

struct ArchiveWriteDeleter {
    void operator()(struct archive* handle) const noexcept { archive_write_free(handle); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const noexcept { archive_entry_free(entry); }
};

using ArchiveWritePtr = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

[[noreturn]] void throwArchiveError(struct archive* handle, const std::string& what) {
    const int code = archive_errno(handle);
    const char* detail = archive_error_string(handle);
    throw ArchiveWriteError(fmt::format("{}: {}", what, detail ? detail : "unknown libarchive error"),
                            std::error_code(code > 0 ? code : EIO, std::generic_category()));
}

void addEntry(struct archive* handle, const std::string& name, const Bytes& data,
              const std::filesystem::path& path) {
    ArchiveEntryPtr entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), kEntryTime, 0);
    archive_entry_set_uid(entry.get(), 0);
    archive_entry_set_gid(entry.get(), 0);

    if (archive_write_header(handle, entry.get()) != ARCHIVE_OK) {
        throwArchiveError(handle, fmt::format("Cannot add '{}' to '{}'", name, path.string()));
    }
    if (!data.empty()) {
        const la_ssize_t written = archive_write_data(handle, data.data(), data.size());
        if (written < 0 || static_cast<std::size_t>(written) != data.size()) {
            throwArchiveError(handle, fmt::format("Cannot write '{}' to '{}'", name, path.string()));
        }
    }
}

std::size_t buildZip(const std::vector<StagedPage>& pages, const Bytes& metadata, const std::filesystem::path& path) {
    ArchiveWritePtr zip(archive_write_new());
    if (!zip) {
        throw ArchiveWriteError("Cannot allocate archive writer", std::make_error_code(std::errc::not_enough_memory));
    }
    if (archive_write_set_format_zip(zip.get()) != ARCHIVE_OK ||
        archive_write_zip_set_compression_deflate(zip.get()) != ARCHIVE_OK) {
        throwArchiveError(zip.get(), "Cannot configure zip output");
    }
    if (archive_write_open_filename(zip.get(), path.c_str()) != ARCHIVE_OK) {
        throwArchiveError(zip.get(), fmt::format("Cannot create '{}'", path.string()));
    }

    for (const auto& page : pages) {
        addEntry(zip.get(), page.entry_name, detail::readFile(page.path), path);
    }
    addEntry(zip.get(), MetadataWriter::kFileName, metadata, path);

    // Central directory is flushed here; a full disk usually surfaces now.
    if (archive_write_close(zip.get()) != ARCHIVE_OK) {
        throwArchiveError(zip.get(), fmt::format("Cannot finish '{}'", path.string()));
    }
    return pages.size() + 1;
}

std::size_t buildDirectory(const std::vector<StagedPage>& pages, const Bytes& metadata,
                           const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::create_directory(path, ec) || ec) {
        throw ArchiveWriteError(fmt::format("Cannot create '{}'", path.string()),
                                ec ? ec : std::make_error_code(std::errc::file_exists));
    }
    for (const auto& page : pages) {
        const auto target = path / page.entry_name;
        std::filesystem::copy_file(page.path, target, ec);
        if (ec) {
            throw ArchiveWriteError(fmt::format("Cannot copy '{}' to '{}'", page.path.string(), target.string()),
                                    ec);
        }
    }
    const auto metadata_path = path / MetadataWriter::kFileName;
    detail::writeFile(metadata_path, metadata.data(), metadata.size());
    return pages.size() + 1;
}

// Moves a finished build over `destination`. Plain files are swapped with one
// rename; directories go through a backup so the old archive survives a
// failed swap.
void moveIntoPlace(const std::filesystem::path& built, const std::filesystem::path& destination) {
    std::error_code ec;
    const bool replacing_tree = std::filesystem::exists(destination, ec) &&
                                (std::filesystem::is_directory(destination, ec) ||
                                 std::filesystem::is_directory(built, ec));
    if (!replacing_tree) {
        std::filesystem::rename(built, destination, ec);
        if (ec) {
            throw ArchiveWriteError(fmt::format("Cannot move archive into '{}'", destination.string()), ec);
        }
        return;
    }

    const auto backup = detail::temporarySibling(destination, "old");
    std::filesystem::rename(destination, backup, ec);
    if (ec) {
        throw ArchiveWriteError(fmt::format("Cannot set aside previous archive '{}'", destination.string()), ec);
    }
    std::filesystem::rename(built, destination, ec);
    if (ec) {
        std::error_code restore_ec;
        std::filesystem::rename(backup, destination, restore_ec);
        throw ArchiveWriteError(fmt::format("Cannot move archive into '{}'", destination.string()), ec);
    }
    removeQuietly(backup);
}

} // namespace

Archive ArchiveBuilder::build(const ChapterResult& result, const Bytes& metadata,
                              const std::filesystem::path& destination, bool compress) {
    const auto pages = result.succeededPages();
    if (result.status == ChapterStatus::Failed || pages.empty()) {
        throw ArchiveWriteError(fmt::format("Chapter {} has no pages to archive", result.descriptor.number),
                                std::make_error_code(std::errc::invalid_argument));
    }

    const auto staging = detail::temporarySibling(destination, "partial");
    Archive archive{destination, compress, 0};
    try {
        archive.entries = compress ? buildZip(pages, metadata, staging) : buildDirectory(pages, metadata, staging);
        moveIntoPlace(staging, destination);
    } catch (...) {
        removeQuietly(staging);
        throw;
    }

    log::logger()->debug("chapter {} archived to {} ({} entries)", result.descriptor.number,
                         destination.string(), archive.entries);
    return archive;
}

} // namespace toonfetch

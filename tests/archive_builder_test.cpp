#include "toonfetch/archive_builder.hpp"
#include "toonfetch/detail/file_utils.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/metadata_writer.hpp"

#include "support/cbz_reader.hpp"
#include "support/temp_dir.hpp"
#include "support/test_images.hpp"

#include <algorithm>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace toonfetch {
namespace {

class ArchiveBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        staging_ = dir_.path() / "staging";
        std::filesystem::create_directories(staging_);
        output_ = dir_.path() / "out";
        std::filesystem::create_directories(output_);
        const std::string xml = "<ComicInfo><Number>3</Number></ComicInfo>\n";
        metadata_ = Bytes(xml.begin(), xml.end());
    }

    // Stages pages 0..count-1, leaving out the indices in `missing`.
    ChapterResult stage(std::size_t count, const std::vector<std::size_t>& missing = {}) {
        ChapterResult result;
        result.descriptor.series_title = "Tower of Ink";
        result.descriptor.number = 3;
        for (std::size_t i = 0; i < count; ++i) {
            PageOutcome outcome;
            outcome.index = i;
            if (std::find(missing.begin(), missing.end(), i) != missing.end()) {
                outcome.failure = PageFailure::Permanent;
                outcome.error_message = "HTTP 404";
            } else {
                StagedPage page;
                page.index = i;
                page.extension = "png";
                page.entry_name = "00" + std::to_string(i) + ".png";
                page.path = staging_ / page.entry_name;
                const auto bytes = test::makePng(static_cast<std::uint32_t>(i + 1), 4);
                detail::writeFile(page.path, bytes.data(), bytes.size());
                page.size = bytes.size();
                outcome.page = page;
            }
            result.pages.push_back(outcome);
        }
        if (missing.empty()) {
            result.status = ChapterStatus::Success;
        } else {
            result.status = missing.size() == count ? ChapterStatus::Failed : ChapterStatus::PartialFailure;
        }
        return result;
    }

    std::vector<std::filesystem::path> outputEntries() const {
        std::vector<std::filesystem::path> entries;
        for (const auto& entry : std::filesystem::directory_iterator(output_)) {
            entries.push_back(entry.path());
        }
        return entries;
    }

    test::TempDir dir_;
    std::filesystem::path staging_;
    std::filesystem::path output_;
    Bytes metadata_;
};

TEST_F(ArchiveBuilderTest, CompressedArchiveHoldsOrderedPagesAndMetadata) {
    const auto result = stage(3);
    const auto destination = output_ / "003.cbz";

    const auto archive = ArchiveBuilder::build(result, metadata_, destination, true);
    EXPECT_EQ(archive.path, destination);
    EXPECT_TRUE(archive.compressed);
    EXPECT_EQ(archive.entries, 4u);

    const auto entries = test::readCbz(destination);
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].name, "000.png");
    EXPECT_EQ(entries[1].name, "001.png");
    EXPECT_EQ(entries[2].name, "002.png");
    EXPECT_EQ(entries[3].name, MetadataWriter::kFileName);
    EXPECT_EQ(entries[1].data, test::makePng(2, 4));
    EXPECT_EQ(entries[3].data, metadata_);
    EXPECT_EQ(outputEntries().size(), 1u);
}

TEST_F(ArchiveBuilderTest, PartialChapterContainsOnlySuccessfulPages) {
    const auto result = stage(4, {1, 2});
    const auto destination = output_ / "003.cbz";

    (void)ArchiveBuilder::build(result, metadata_, destination, true);
    const auto entries = test::readCbz(destination);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "000.png");
    EXPECT_EQ(entries[1].name, "003.png");
    EXPECT_EQ(entries[2].name, MetadataWriter::kFileName);
}

TEST_F(ArchiveBuilderTest, FailedChapterWritesNothing) {
    const auto result = stage(2, {0, 1});
    const auto destination = output_ / "003.cbz";

    EXPECT_THROW((void)ArchiveBuilder::build(result, metadata_, destination, true), ArchiveWriteError);
    EXPECT_TRUE(outputEntries().empty());
}

TEST_F(ArchiveBuilderTest, CompressedAndDirectoryOutputsMatch) {
    const auto result = stage(3);
    const auto cbz = output_ / "003.cbz";
    const auto loose = output_ / "003";

    (void)ArchiveBuilder::build(result, metadata_, cbz, true);
    const auto archive = ArchiveBuilder::build(result, metadata_, loose, false);
    EXPECT_FALSE(archive.compressed);
    ASSERT_TRUE(std::filesystem::is_directory(loose));

    const auto entries = test::readCbz(cbz);
    std::size_t files = 0;
    for (const auto& file : std::filesystem::directory_iterator(loose)) {
        (void)file;
        ++files;
    }
    EXPECT_EQ(files, entries.size());
    for (const auto& entry : entries) {
        EXPECT_EQ(detail::readFile(loose / entry.name), entry.data) << entry.name;
    }
}

TEST_F(ArchiveBuilderTest, OutputIsByteIdenticalAcrossRuns) {
    const auto result = stage(2);
    (void)ArchiveBuilder::build(result, metadata_, output_ / "a.cbz", true);
    (void)ArchiveBuilder::build(result, metadata_, output_ / "b.cbz", true);
    EXPECT_EQ(detail::readFile(output_ / "a.cbz"), detail::readFile(output_ / "b.cbz"));
}

TEST_F(ArchiveBuilderTest, RebuildReplacesPreviousArchiveWholesale) {
    const auto destination = output_ / "003.cbz";
    (void)ArchiveBuilder::build(stage(3), metadata_, destination, true);
    (void)ArchiveBuilder::build(stage(1), metadata_, destination, true);

    EXPECT_EQ(test::readCbz(destination).size(), 2u);
    EXPECT_EQ(outputEntries().size(), 1u);
}

TEST_F(ArchiveBuilderTest, RebuildReplacesPreviousDirectoryWholesale) {
    const auto destination = output_ / "003";
    (void)ArchiveBuilder::build(stage(3), metadata_, destination, false);
    (void)ArchiveBuilder::build(stage(3, {1, 2}), metadata_, destination, false);

    EXPECT_TRUE(std::filesystem::exists(destination / "000.png"));
    EXPECT_FALSE(std::filesystem::exists(destination / "001.png"));
    EXPECT_EQ(outputEntries().size(), 1u);
}

TEST_F(ArchiveBuilderTest, FaultMidBuildLeavesNoPartialArchive) {
    const auto result = stage(3);
    // The second page vanishes after staging, so the build fails part way.
    std::filesystem::remove(result.pages[1].page->path);
    const auto destination = output_ / "003.cbz";

    EXPECT_THROW((void)ArchiveBuilder::build(result, metadata_, destination, true), ArchiveWriteError);
    EXPECT_FALSE(std::filesystem::exists(destination));
    EXPECT_TRUE(outputEntries().empty());
}

TEST_F(ArchiveBuilderTest, FaultMidBuildKeepsPreviousArchive) {
    const auto destination = output_ / "003";
    (void)ArchiveBuilder::build(stage(2), metadata_, destination, false);

    const auto result = stage(3);
    std::filesystem::remove(result.pages[2].page->path);
    EXPECT_THROW((void)ArchiveBuilder::build(result, metadata_, destination, false), ArchiveWriteError);

    EXPECT_TRUE(std::filesystem::exists(destination / "001.png"));
    EXPECT_FALSE(std::filesystem::exists(destination / "002.png"));
    EXPECT_EQ(outputEntries().size(), 1u);
}

} // namespace
} // namespace toonfetch

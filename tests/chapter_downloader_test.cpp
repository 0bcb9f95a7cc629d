#include "toonfetch/chapter_downloader.hpp"
#include "toonfetch/errors.hpp"

#include "support/fake_http_client.hpp"
#include "support/temp_dir.hpp"
#include "support/test_images.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>

#include <fmt/format.h>
#include <gtest/gtest.h>

namespace toonfetch {
namespace {

using test::FakeHttpClient;
using test::ScriptedReply;
using std::chrono::milliseconds;

std::string pageUrl(std::size_t index) { return fmt::format("https://cdn.example.com/ep7/{}.png", index); }

ChapterDescriptor chapter7() {
    ChapterDescriptor descriptor;
    descriptor.series_title = "Tower of Ink";
    descriptor.number = 7;
    descriptor.title = "Episode 7";
    descriptor.url = "https://www.example.com/viewer?episode_no=7";
    return descriptor;
}

std::vector<PageReference> pages(std::size_t count) {
    std::vector<PageReference> refs;
    for (std::size_t i = 0; i < count; ++i) {
        refs.push_back(PageReference{7, i, pageUrl(i), 0, 0});
    }
    return refs;
}

FetchOptions fastOptions() {
    FetchOptions options;
    options.retry.base_delay = milliseconds(0);
    return options;
}

Bytes readBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

class RecordingListener final : public ProgressListener {
public:
    void chapterStarted(const ChapterDescriptor&, std::size_t) override {}
    void pageFinished(std::int64_t, std::size_t page_index, bool succeeded) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.emplace_back(page_index, succeeded);
    }
    void chapterFinished(const ChapterOutcome&) override {}

    std::vector<std::pair<std::size_t, bool>> finished;

private:
    std::mutex mutex_;
};

TEST(ChapterDownloaderTest, OutputOrderIgnoresCompletionOrder) {
    FakeHttpClient client;
    constexpr std::size_t count = 6;
    for (std::size_t i = 0; i < count; ++i) {
        // Earlier pages answer later, so completion order is reversed.
        client.script(pageUrl(i),
                      {ScriptedReply::ok(test::makePng(static_cast<std::uint32_t>(i + 1), 2), "image/png",
                                         milliseconds(20 * (count - i)))});
    }
    const ImageFetcher fetcher(client, fastOptions());
    RecordingListener listener;
    const ChapterDownloader observed(fetcher, count, &listener);
    test::TempDir dir;

    auto shuffled = pages(count);
    std::swap(shuffled[0], shuffled[4]);
    const auto result = observed.download(chapter7(), shuffled, dir.path() / "staging", CancellationToken{});

    ASSERT_EQ(result.status, ChapterStatus::Success);
    ASSERT_EQ(result.pages.size(), count);
    for (std::size_t i = 0; i < count; ++i) {
        ASSERT_TRUE(result.pages[i].succeeded());
        EXPECT_EQ(result.pages[i].index, i);
        EXPECT_EQ(result.pages[i].page->entry_name, fmt::format("{:03}.png", i));
        EXPECT_EQ(result.pages[i].page->width, i + 1);
        EXPECT_EQ(readBytes(result.pages[i].page->path), test::makePng(static_cast<std::uint32_t>(i + 1), 2));
    }

    ASSERT_EQ(listener.finished.size(), count);
    EXPECT_EQ(listener.finished.front().first, count - 1);
    EXPECT_EQ(listener.finished.back().first, 0u);
}

TEST(ChapterDownloaderTest, RespectsPageConcurrencyBudget) {
    FakeHttpClient client;
    for (std::size_t i = 0; i < 12; ++i) {
        client.script(pageUrl(i), {ScriptedReply::ok(test::makePng(1, 1), "image/png", milliseconds(15))});
    }
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 3);
    test::TempDir dir;

    const auto result = downloader.download(chapter7(), pages(12), dir.path(), CancellationToken{});
    EXPECT_EQ(result.status, ChapterStatus::Success);
    EXPECT_LE(client.maxInFlight(), 3);
    EXPECT_GE(client.maxInFlight(), 2);
}

TEST(ChapterDownloaderTest, FailedPagesYieldPartialFailure) {
    FakeHttpClient client;
    client.script(pageUrl(0), {ScriptedReply::ok(test::makePng(3, 3), "image/png")});
    client.script(pageUrl(1), {ScriptedReply::withStatus(404)});
    client.script(pageUrl(2), {ScriptedReply::ok(test::makeJpeg(3, 3), "")});
    client.script(pageUrl(3), {ScriptedReply::withStatus(500)});
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 2);
    test::TempDir dir;

    const auto result = downloader.download(chapter7(), pages(4), dir.path(), CancellationToken{});
    EXPECT_EQ(result.status, ChapterStatus::PartialFailure);
    EXPECT_EQ(result.failedPages(), (std::vector<std::size_t>{1, 3}));
    EXPECT_EQ(result.pages[1].failure, PageFailure::Permanent);
    EXPECT_EQ(result.pages[3].failure, PageFailure::Transient);

    const auto staged = result.succeededPages();
    ASSERT_EQ(staged.size(), 2u);
    EXPECT_EQ(staged[0].entry_name, "000.png");
    EXPECT_EQ(staged[1].entry_name, "002.jpeg");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "001.png"));
}

TEST(ChapterDownloaderTest, NoSuccessfulPagesIsFailed) {
    FakeHttpClient client;
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 4);
    test::TempDir dir;

    const auto result = downloader.download(chapter7(), pages(3), dir.path(), CancellationToken{});
    EXPECT_EQ(result.status, ChapterStatus::Failed);
    EXPECT_EQ(result.failedPages().size(), 3u);
    EXPECT_TRUE(result.succeededPages().empty());
}

TEST(ChapterDownloaderTest, PaddingFollowsLargestIndex) {
    FakeHttpClient client;
    std::vector<PageReference> refs{PageReference{7, 1200, pageUrl(1200), 0, 0}};
    client.script(pageUrl(1200), {ScriptedReply::ok(test::makeGif(2, 2), "image/gif")});
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 1);
    test::TempDir dir;

    const auto result = downloader.download(chapter7(), refs, dir.path(), CancellationToken{});
    ASSERT_EQ(result.status, ChapterStatus::Success);
    EXPECT_EQ(result.pages[0].page->entry_name, "1200.gif");
}

TEST(ChapterDownloaderTest, RejectsDuplicateIndices) {
    FakeHttpClient client;
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 2);
    test::TempDir dir;

    auto refs = pages(2);
    refs[1].index = 0;
    EXPECT_THROW((void)downloader.download(chapter7(), refs, dir.path(), CancellationToken{}), InvalidDescriptor);
    EXPECT_EQ(client.totalCalls(), 0);
}

TEST(ChapterDownloaderTest, RejectsPagesOfAnotherChapter) {
    FakeHttpClient client;
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 2);
    test::TempDir dir;

    auto refs = pages(2);
    refs[1].chapter_number = 8;
    EXPECT_THROW((void)downloader.download(chapter7(), refs, dir.path(), CancellationToken{}), InvalidDescriptor);
}

TEST(ChapterDownloaderTest, CancelledBeforeStartFetchesNothing) {
    FakeHttpClient client;
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 2);
    test::TempDir dir;

    CancellationToken cancel;
    cancel.cancel();
    const auto result = downloader.download(chapter7(), pages(5), dir.path(), cancel);
    EXPECT_EQ(result.status, ChapterStatus::Failed);
    EXPECT_EQ(client.totalCalls(), 0);
    for (const auto& outcome : result.pages) {
        EXPECT_EQ(outcome.failure, PageFailure::Cancelled);
    }
}

TEST(ChapterDownloaderTest, StagingFailureIsArchiveWriteError) {
    FakeHttpClient client;
    client.script(pageUrl(0), {ScriptedReply::ok(test::makePng(1, 1), "image/png")});
    const ImageFetcher fetcher(client, fastOptions());
    const ChapterDownloader downloader(fetcher, 1);
    test::TempDir dir;

    // A regular file where the staging directory should go.
    const auto blocker = dir.path() / "staging";
    std::ofstream(blocker) << "x";
    EXPECT_THROW((void)downloader.download(chapter7(), pages(1), blocker / "inner", CancellationToken{}),
                 ArchiveWriteError);
}

} // namespace
} // namespace toonfetch

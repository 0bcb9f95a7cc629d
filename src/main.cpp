#include "toonfetch/catalog.hpp"
#include "toonfetch/config.hpp"
#include "toonfetch/errors.hpp"
#include "toonfetch/http_client.hpp"
#include "toonfetch/logging.hpp"
#include "toonfetch/progress_panel.hpp"
#include "toonfetch/series_orchestrator.hpp"
#include "toonfetch/url.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitIncomplete = 2;

std::atomic<bool> g_interrupted{false};

void handleSignal(int) { g_interrupted.store(true); }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <manifest.json>" << std::endl;
    std::cerr << "Options:\n"
              << "  -d, --dest <directory>   Parent folder for downloads (default: current directory)\n"
              << "  -c, --chapters <n>       Chapters downloaded in parallel (default: 4)\n"
              << "  -p, --pages <n>          Pages downloaded in parallel per chapter (default: 4)\n"
              << "  --timeout <seconds>      Per-request timeout (default: 30)\n"
              << "  --retries <n>            Attempts per page before giving up (default: 3)\n"
              << "  --start <n>              Chapter to start downloading from\n"
              << "  --end <n>                Last chapter to download\n"
              << "  --latest                 Only download the latest chapter\n"
              << "  --no-compress            Keep chapters as directories instead of .cbz\n"
              << "  --referer <url>          Referer sent with image requests\n"
              << "  --no-progress            Do not draw the progress panel\n"
              << "  -v, --verbose            More logging; repeat up to -vvvv\n"
              << "  -h, --help               Show this message" << std::endl;
}

long long parseNumber(const std::string& option, const char* value) {
    try {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: {}", option, value));
    }
}

std::size_t parseCount(const std::string& option, const char* value) {
    const auto parsed = parseNumber(option, value);
    if (parsed <= 0) {
        throw std::invalid_argument(fmt::format("{} must be positive, got {}", option, parsed));
    }
    return static_cast<std::size_t>(parsed);
}

// Mirrors the cancellation token onto SIGINT/SIGTERM; the handler itself only
// sets a flag.
class SignalWatcher {
public:
    explicit SignalWatcher(toonfetch::CancellationToken token) : token_(std::move(token)) {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        thread_ = std::thread([this]() {
            while (!done_.load()) {
                if (g_interrupted.load()) {
                    toonfetch::log::logger()->warn("Received interrupt, letting work drain");
                    token_.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }

private:
    toonfetch::CancellationToken token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

void printSummary(const toonfetch::RunReport& report) {
    for (const auto& chapter : report.chapters) {
        if (chapter.status == toonfetch::ChapterStatus::Success) {
            continue;
        }
        std::string missing;
        for (const auto index : chapter.failed_pages) {
            missing += missing.empty() ? std::to_string(index) : ", " + std::to_string(index);
        }
        std::cerr << fmt::format("chapter {}: {}{}{}", chapter.number, toonfetch::toString(chapter.status),
                                 chapter.error_message.empty() ? "" : " - " + chapter.error_message,
                                 missing.empty() ? "" : " (missing pages: " + missing + ")")
                  << std::endl;
    }
    std::cerr << fmt::format("{} succeeded, {} partial, {} failed", report.succeeded, report.partial, report.failed)
              << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    toonfetch::Config config;
    config.destination = std::filesystem::current_path();
    std::string manifest;
    int verbosity = 0;

    try {
        int arg_index = 1;
        while (arg_index < argc) {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;
            auto value = [&]() -> const char* {
                if (!has_value) {
                    throw std::invalid_argument("Missing value for " + option);
                }
                arg_index += 2;
                return argv[arg_index - 1];
            };

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return kExitOk;
            } else if (option == "-d" || option == "--dest" || option == "--destination") {
                config.destination = value();
            } else if (option == "-c" || option == "--chapters") {
                config.chapter_concurrency = parseCount(option, value());
            } else if (option == "-p" || option == "--pages") {
                config.page_concurrency = parseCount(option, value());
            } else if (option == "--timeout") {
                config.request_timeout = std::chrono::seconds(parseCount(option, value()));
            } else if (option == "--retries") {
                config.retry.max_attempts = static_cast<int>(parseCount(option, value()));
            } else if (option == "--start") {
                config.selection.start = parseNumber(option, value());
            } else if (option == "--end") {
                config.selection.end = parseNumber(option, value());
            } else if (option == "--referer") {
                config.referer = value();
            } else if (option == "--latest") {
                config.selection.latest_only = true;
                ++arg_index;
            } else if (option == "--no-compress") {
                config.compress = false;
                ++arg_index;
            } else if (option == "--no-progress") {
                config.show_progress = false;
                ++arg_index;
            } else if (option == "-v" || option == "--verbose") {
                ++verbosity;
                ++arg_index;
            } else if (option.size() > 2 && option.rfind("-v", 0) == 0 &&
                       option.find_first_not_of('v', 1) == std::string::npos) {
                verbosity += static_cast<int>(option.size() - 1);
                ++arg_index;
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return kExitError;
            } else if (manifest.empty()) {
                manifest = option;
                ++arg_index;
            } else {
                printUsage(argv[0]);
                return kExitError;
            }
        }

        if (manifest.empty()) {
            printUsage(argv[0]);
            return kExitError;
        }
        config.verbosity = std::max(1, verbosity);
        toonfetch::validateConfig(config);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        printUsage(argv[0]);
        return kExitError;
    }

    toonfetch::log::init(config.verbosity);
    auto logger = toonfetch::log::logger();

    try {
        const auto catalog = toonfetch::ManifestCatalog::fromFile(manifest);
        const auto jobs = toonfetch::selectChapters(catalog.chapters(), config.selection);

        auto series = catalog.series();
        if (!series.url.empty()) {
            series.url = toonfetch::popQueryParam(series.url, "page");
        }
        logger->info("{}: {} of {} chapter(s) selected", series.title, jobs.size(), catalog.chapters().size());

        std::error_code ec;
        std::filesystem::create_directories(config.destination, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " + config.destination.string() +
                                     " - " + ec.message());
        }

        toonfetch::CancellationToken cancel;
        const SignalWatcher watcher(cancel);

        toonfetch::CurlHttpClient client(config.user_agent);
        std::unique_ptr<toonfetch::ProgressPanel> panel;
        if (config.show_progress) {
            panel = std::make_unique<toonfetch::ProgressPanel>(std::cout);
        }

        const toonfetch::SeriesOrchestrator orchestrator(client, config, panel.get());
        if (panel) {
            panel->start(jobs.size());
        }
        toonfetch::RunReport report;
        try {
            report = orchestrator.run(series, jobs, cancel);
        } catch (...) {
            if (panel) {
                panel->stop();
            }
            throw;
        }
        if (panel) {
            panel->stop();
        }

        printSummary(report);
        return report.allSucceeded() ? kExitOk : kExitIncomplete;
    } catch (const toonfetch::RunFailure& ex) {
        logger->critical("{} ({} chapter(s) completed)", ex.what(), ex.completedChapters());
        return kExitError;
    } catch (const toonfetch::InvalidDescriptor& ex) {
        logger->error("Invalid manifest: {}", ex.what());
        return kExitError;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitError;
    }
}

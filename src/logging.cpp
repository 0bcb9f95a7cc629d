#include "toonfetch/logging.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace toonfetch::log {

namespace {

constexpr const char* kLoggerName = "toonfetch";

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

spdlog::level::level_enum levelForVerbosity(int verbosity) noexcept {
    switch (std::clamp(verbosity, 1, 4)) {
    case 1:
        return spdlog::level::err;
    case 2:
        return spdlog::level::warn;
    case 3:
        return spdlog::level::info;
    default:
        return spdlog::level::debug;
    }
}

void init(int verbosity) {
    logger()->set_level(levelForVerbosity(verbosity));
}

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(flag, [] { instance = createLogger(); });
    return instance;
}

} // namespace toonfetch::log

#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace toonfetch::log {

// Verbosity follows the -v count: 1 error, 2 warn, 3 info, 4 debug.
void init(int verbosity);

[[nodiscard]] spdlog::level::level_enum levelForVerbosity(int verbosity) noexcept;

// The shared "toonfetch" logger; created on first use if init() was skipped.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace toonfetch::log

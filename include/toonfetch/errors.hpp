#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace toonfetch {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Timeout, connection reset, 5xx or 429. Worth another attempt.
class TransientFetchError : public Error {
public:
    using Error::Error;
};

// 4xx other than 429, malformed URL or response. Never retried.
class PermanentFetchError : public Error {
public:
    using Error::Error;
};

class UnsupportedMediaType : public Error {
public:
    using Error::Error;
};

class InvalidDescriptor : public Error {
public:
    using Error::Error;
};

class Cancelled : public Error {
public:
    Cancelled() : Error("operation cancelled") {}
};

class ArchiveWriteError : public Error {
public:
    ArchiveWriteError(const std::string& message, std::error_code code)
        : Error(message + ": " + code.message()), code_(code) {}

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }

    // Local resource exhaustion is fatal to the whole run, not just the chapter.
    [[nodiscard]] bool isResourceExhaustion() const noexcept;

private:
    std::error_code code_;
};

class RunFailure : public Error {
public:
    RunFailure(const std::string& message, std::size_t completed_chapters)
        : Error(message), completed_chapters_(completed_chapters) {}

    [[nodiscard]] std::size_t completedChapters() const noexcept { return completed_chapters_; }

private:
    std::size_t completed_chapters_;
};

} // namespace toonfetch

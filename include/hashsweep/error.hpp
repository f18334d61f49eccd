#pragma once

#include <stdexcept>
#include <string>

namespace hashsweep {

/**
 * Error taxonomy for the sweep pipeline.
 *
 * Setup failures (ConfigError, IOError on the input source) abort a run
 * before any chunk is dispatched. HashError is local to one candidate.
 * ChannelError terminates the worker that observed it.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Setup errors
    INVALID_CONFIG = 100,
    UNKNOWN_ALGORITHM = 101,

    // Processing errors
    HASH_FAILED = 200,
    CHANNEL_CLOSED = 201,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PERMISSION_DENIED = 301,
    WRITE_FAILED = 302
};

class HashsweepException : public std::runtime_error {
public:
    explicit HashsweepException(ErrorCode code, const std::string& message,
                                const std::string& context = "")
        : std::runtime_error(format_message(code, message, context))
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context) {
        std::string result = "hashsweep error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
};

class ConfigError : public HashsweepException {
public:
    explicit ConfigError(const std::string& message, const std::string& context = "",
                         ErrorCode code = ErrorCode::INVALID_CONFIG)
        : HashsweepException(code, message, context) {}
};

class HashError : public HashsweepException {
public:
    explicit HashError(const std::string& message, const std::string& context = "")
        : HashsweepException(ErrorCode::HASH_FAILED, message, context) {}
};

class ChannelError : public HashsweepException {
public:
    explicit ChannelError(const std::string& message, const std::string& context = "")
        : HashsweepException(ErrorCode::CHANNEL_CLOSED, message, context) {}
};

class IOError : public HashsweepException {
public:
    explicit IOError(const std::string& message, const std::string& context = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : HashsweepException(code, message, context) {}
};

} // namespace hashsweep

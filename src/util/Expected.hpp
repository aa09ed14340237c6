#pragma once

#include <string>
#include <utility>

namespace havc {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotFound,
    IoError,
    SpawnFailed,
    ExternalToolFailed,   // git exited nonzero
    Timeout,              // child killed after the deadline
    OutputTooLarge,       // child killed after exceeding the output cap
    RestoreRolledBack,    // restore failed, previous content written back
    RestoreFailed,        // restore failed and rollback failed: file state unknown
    InternalError
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::SpawnFailed: return "spawn-failed";
        case ErrorCode::ExternalToolFailed: return "external-tool-failed";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::OutputTooLarge: return "output-too-large";
        case ErrorCode::RestoreRolledBack: return "restore-rolled-back";
        case ErrorCode::RestoreFailed: return "restore-failed";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    int exitCode{0};          // child exit status for ExternalToolFailed
    std::string toolStderr;   // child stderr for ExternalToolFailed
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}

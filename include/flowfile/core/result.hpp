#pragma once

#include <string>
#include <optional>
#include <utility>
#include <variant>

namespace flowfile {

/**
 * @brief Error classes surfaced by the library
 *
 * Grouped by the policy a caller applies to them:
 * - framing: EndOfStream (clean, "no more records"), NoHeader, Malformed
 * - configuration: Configuration, UnknownChecksum, NotResettable, NotSeekable,
 *   InvalidArgument (never retried automatically)
 * - transport: Transport, HttpStatus, Io (retryable when payloads can reset)
 * - checksum: ChecksumMismatch, ChecksumMissing
 * - reassembly: ReassemblyTimeout
 */
enum class ErrorCode {
    EndOfStream,
    NoHeader,
    Malformed,
    Configuration,
    UnknownChecksum,
    NotResettable,
    NotSeekable,
    InvalidArgument,
    Transport,
    HttpStatus,
    Io,
    ChecksumMismatch,
    ChecksumMissing,
    ReassemblyTimeout,
    Terminated,
    Closed
};

const char* error_code_name(ErrorCode code) noexcept;

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool is(ErrorCode c) const noexcept { return code == c; }

    /// Transport-class failures that a resettable send may replay.
    bool retryable() const noexcept {
        return code == ErrorCode::Transport || code == ErrorCode::HttpStatus || code == ErrorCode::Io;
    }

    std::string describe() const { return std::string(error_code_name(code)) + ": " + message; }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>(ErrValue<Error>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error(code, std::move(message))));
}

} // namespace flowfile

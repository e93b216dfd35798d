#pragma once

#include "flowfile/core/file.hpp"
#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace flowfile::codec {

/**
 * @brief Iterates the FlowFile records of one byte stream
 *
 * Usage:
 * @code
 *   Scanner scanner(stream);
 *   while (scanner.scan()) {
 *       File& f = scanner.file();
 *       ...
 *   }
 *   if (scanner.error()) { ... }
 * @endcode
 *
 * Each scan() closes the previous record first: a sequential record is
 * drained, a record on a seekable input is skipped by seeking past it.
 */
class Scanner {
public:
    enum class State { Idle, HaveRecord, Exhausted, Errored };

    explicit Scanner(std::shared_ptr<InputStream> in);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    /// Advances to the next record; false on clean exhaustion or error.
    bool scan();

    /// Current record. Only valid after scan() returned true.
    File& file() { return current_; }

    /// Framing or I/O error that stopped the scan; empty on clean exhaustion.
    const std::optional<Error>& error() const noexcept { return error_; }

    State state() const noexcept { return state_; }
    std::uint64_t records() const noexcept { return records_; }

private:
    Result<void> finish_current();

    std::shared_ptr<InputStream> in_;
    std::shared_ptr<SeekableStream> seekable_;
    State state_ = State::Idle;
    File current_;
    std::optional<Error> error_;
    std::uint64_t records_ = 0;
};

const char* scanner_state_name(Scanner::State state) noexcept;

} // namespace flowfile::codec

#pragma once

#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace flowfile {
namespace network {

/**
 * @brief Bounded byte pipe between one writer thread and one reader thread
 *
 * THREAD SAFETY:
 * - write() blocks while @p capacity chunks are queued (backpressure)
 * - read() blocks until a chunk arrives or the pipe is closed
 *
 * close() lets the reader drain what is queued and then see end of stream.
 * close_with_error() is seen by the reader immediately, dropping queued
 * bytes, and fail_reader() is seen by the writer on its next write().
 */
class BytePipe : public InputStream, public OutputSink {
public:
    explicit BytePipe(std::size_t capacity = 16);

    BytePipe(const BytePipe&) = delete;
    BytePipe& operator=(const BytePipe&) = delete;

    Result<void> write(const std::uint8_t* data, std::size_t len) override;
    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;

    /// Writer side: no more data.
    void close();

    /// Writer side: abort; the reader gets @p error instead of end of stream.
    void close_with_error(Error error);

    /// Reader side: stop consuming; pending and future writes fail with @p error.
    void fail_reader(Error error);

    std::size_t queued() const;

private:
    std::size_t capacity_;
    std::queue<std::vector<std::uint8_t>> chunks_;
    std::vector<std::uint8_t> current_;
    std::size_t current_pos_ = 0;
    bool closed_ = false;
    std::optional<Error> writer_error_;
    std::optional<Error> reader_error_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

} // namespace network
} // namespace flowfile

#pragma once

#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace flowfile {
namespace network {

/**
 * @brief Buffered writer that never holds bytes longer than a flush interval
 *
 * Bytes are forwarded to the destination when the buffer fills or when the
 * background flusher wakes up, whichever comes first. An error raised by a
 * background flush is reported by the next write() or flush().
 */
class LatencyWriter : public OutputSink {
public:
    LatencyWriter(OutputSink& dst, std::size_t buffer_size, std::chrono::milliseconds latency);
    ~LatencyWriter() override;

    LatencyWriter(const LatencyWriter&) = delete;
    LatencyWriter& operator=(const LatencyWriter&) = delete;

    Result<void> write(const std::uint8_t* data, std::size_t len) override;
    Result<void> flush();

    /// Final flush; stops the background flusher. Idempotent.
    Result<void> close();

    /// Stops the flusher without flushing.
    void abandon();

    std::size_t buffered() const;

private:
    Result<void> flush_locked();
    void flush_loop();
    void stop_flusher();

    OutputSink& dst_;
    std::size_t capacity_;
    std::chrono::milliseconds latency_;
    std::vector<std::uint8_t> buffer_;
    std::optional<Error> error_;
    bool stopping_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread flusher_;
};

} // namespace network
} // namespace flowfile

#include "flowfile/network/latency_writer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace flowfile {
namespace network {

LatencyWriter::LatencyWriter(OutputSink& dst, std::size_t buffer_size, std::chrono::milliseconds latency)
    : dst_(dst)
    , capacity_(std::max<std::size_t>(buffer_size, 1))
    , latency_(latency) {
    buffer_.reserve(capacity_);
    if (latency_.count() > 0) {
        flusher_ = std::thread([this]() { flush_loop(); });
    }
}

LatencyWriter::~LatencyWriter() {
    stop_flusher();
}

Result<void> LatencyWriter::write(const std::uint8_t* data, std::size_t len) {
    std::lock_guard lock(mutex_);
    if (error_) {
        return Err<void>(*error_);
    }
    while (len > 0) {
        const auto n = std::min(len, capacity_ - buffer_.size());
        buffer_.insert(buffer_.end(), data, data + n);
        data += n;
        len -= n;
        if (buffer_.size() == capacity_) {
            if (auto flushed = flush_locked(); flushed.is_error()) {
                return flushed;
            }
        }
    }
    return Ok();
}

Result<void> LatencyWriter::flush() {
    std::lock_guard lock(mutex_);
    if (error_) {
        return Err<void>(*error_);
    }
    return flush_locked();
}

Result<void> LatencyWriter::flush_locked() {
    if (buffer_.empty()) {
        return Ok();
    }
    auto written = dst_.write(buffer_.data(), buffer_.size());
    buffer_.clear();
    if (written.is_error()) {
        error_ = written.error();
    }
    return written;
}

void LatencyWriter::flush_loop() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        cv_.wait_for(lock, latency_, [this]() { return stopping_; });
        if (stopping_) {
            break;
        }
        if (!error_ && !buffer_.empty()) {
            if (auto flushed = flush_locked(); flushed.is_error()) {
                spdlog::debug("Timed flush failed: {}", flushed.error().message);
            }
        }
    }
}

void LatencyWriter::stop_flusher() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (flusher_.joinable()) {
        flusher_.join();
    }
}

Result<void> LatencyWriter::close() {
    stop_flusher();
    return flush();
}

void LatencyWriter::abandon() {
    stop_flusher();
    std::lock_guard lock(mutex_);
    buffer_.clear();
}

std::size_t LatencyWriter::buffered() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

} // namespace network
} // namespace flowfile

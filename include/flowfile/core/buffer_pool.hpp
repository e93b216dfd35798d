#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace flowfile {

/**
 * @brief Pool of fixed-size scratch buffers
 *
 * A Lease hands out one buffer for the duration of a call and returns it on
 * destruction. Returned buffers are zeroed so nothing leaks between callers,
 * and at most max_idle buffers are kept.
 */
class BufferPool {
public:
    static constexpr std::size_t kDefaultBufferSize = 32 * 1024;

    explicit BufferPool(std::size_t buffer_size = kDefaultBufferSize, std::size_t max_idle = 8)
        : buffer_size_(buffer_size), max_idle_(max_idle) {}

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    class Lease {
    public:
        Lease(BufferPool& pool, std::vector<std::uint8_t> buffer)
            : pool_(&pool), buffer_(std::move(buffer)) {}
        ~Lease() {
            if (pool_) {
                pool_->release(std::move(buffer_));
            }
        }

        Lease(Lease&& other) noexcept : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
            other.pool_ = nullptr;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        std::uint8_t* data() noexcept { return buffer_.data(); }
        std::size_t size() const noexcept { return buffer_.size(); }

    private:
        BufferPool* pool_;
        std::vector<std::uint8_t> buffer_;
    };

    Lease acquire() {
        std::lock_guard lock(mutex_);
        if (idle_.empty()) {
            return Lease(*this, std::vector<std::uint8_t>(buffer_size_));
        }
        auto buffer = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(buffer));
    }

    std::size_t idle() const {
        std::lock_guard lock(mutex_);
        return idle_.size();
    }

    std::size_t buffer_size() const noexcept { return buffer_size_; }

private:
    void release(std::vector<std::uint8_t> buffer) {
        std::fill(buffer.begin(), buffer.end(), std::uint8_t{0});
        std::lock_guard lock(mutex_);
        if (idle_.size() < max_idle_ && buffer.size() == buffer_size_) {
            idle_.push_back(std::move(buffer));
        }
    }

    std::size_t buffer_size_;
    std::size_t max_idle_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::uint8_t>> idle_;
};

} // namespace flowfile

#include "flowfile/network/pipe.hpp"

#include <algorithm>
#include <cstring>

namespace flowfile {
namespace network {

BytePipe::BytePipe(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {
}

Result<void> BytePipe::write(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return Ok();
    }
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this]() {
        return chunks_.size() < capacity_ || reader_error_ || closed_;
    });
    if (reader_error_) {
        return Err<void>(*reader_error_);
    }
    if (closed_) {
        return Err<void>(ErrorCode::Closed, "write on closed pipe");
    }
    chunks_.emplace(data, data + len);
    lock.unlock();
    not_empty_.notify_one();
    return Ok();
}

Result<std::size_t> BytePipe::read(std::uint8_t* buffer, std::size_t len) {
    if (len == 0) {
        return Ok<std::size_t>(0);
    }
    std::unique_lock lock(mutex_);
    if (current_pos_ == current_.size()) {
        not_empty_.wait(lock, [this]() {
            return !chunks_.empty() || closed_ || writer_error_;
        });
        if (writer_error_) {
            return Err<std::size_t>(*writer_error_);
        }
        if (chunks_.empty()) {
            return Ok<std::size_t>(0);
        }
        current_ = std::move(chunks_.front());
        current_pos_ = 0;
        chunks_.pop();
        not_full_.notify_one();
    } else if (writer_error_) {
        return Err<std::size_t>(*writer_error_);
    }

    const auto n = std::min(len, current_.size() - current_pos_);
    std::memcpy(buffer, current_.data() + current_pos_, n);
    current_pos_ += n;
    return Ok(n);
}

void BytePipe::close() {
    {
        std::unique_lock lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void BytePipe::close_with_error(Error error) {
    {
        std::unique_lock lock(mutex_);
        closed_ = true;
        writer_error_ = std::move(error);
        std::queue<std::vector<std::uint8_t>>().swap(chunks_);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void BytePipe::fail_reader(Error error) {
    {
        std::unique_lock lock(mutex_);
        reader_error_ = std::move(error);
        std::queue<std::vector<std::uint8_t>>().swap(chunks_);
    }
    not_full_.notify_all();
}

std::size_t BytePipe::queued() const {
    std::unique_lock lock(mutex_);
    return chunks_.size();
}

} // namespace network
} // namespace flowfile

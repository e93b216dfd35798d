#include "flowfile/codec/scanner.hpp"
#include "flowfile/codec/wire_codec.hpp"

#include <spdlog/spdlog.h>

namespace flowfile::codec {

const char* scanner_state_name(Scanner::State state) noexcept {
    switch (state) {
        case Scanner::State::Idle: return "idle";
        case Scanner::State::HaveRecord: return "have_record";
        case Scanner::State::Exhausted: return "exhausted";
        case Scanner::State::Errored: return "errored";
    }
    return "unknown";
}

Scanner::Scanner(std::shared_ptr<InputStream> in)
    : in_(std::move(in))
    , seekable_(std::dynamic_pointer_cast<SeekableStream>(in_)) {
}

Result<void> Scanner::finish_current() {
    if (seekable_) {
        const auto end = current_.window_offset() + current_.size();
        current_.exhaust();
        if (auto closed = current_.close(); closed.is_error()) {
            return closed;
        }
        return seekable_->seek(end);
    }
    return current_.close();
}

bool Scanner::scan() {
    if (state_ == State::Exhausted || state_ == State::Errored) {
        return false;
    }

    if (state_ == State::HaveRecord) {
        if (auto finished = finish_current(); finished.is_error()) {
            error_ = finished.error();
            state_ = State::Errored;
            spdlog::debug("Scanner stopped after {} records: {}", records_, error_->describe());
            return false;
        }
    }

    auto next = decode(in_);
    if (next.is_error()) {
        if (next.error().is(ErrorCode::EndOfStream)) {
            state_ = State::Exhausted;
            current_ = File();
            return false;
        }
        error_ = next.error();
        state_ = State::Errored;
        current_ = File();
        spdlog::debug("Scanner stopped after {} records: {}", records_, error_->describe());
        return false;
    }

    current_ = std::move(next.value());
    state_ = State::HaveRecord;
    ++records_;
    return true;
}

} // namespace flowfile::codec

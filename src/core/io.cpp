#include "flowfile/core/io.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace flowfile {
namespace fs = std::filesystem;

Result<std::size_t> read_full(InputStream& in, std::uint8_t* buffer, std::size_t len) {
    std::size_t total = 0;
    while (total < len) {
        auto result = in.read(buffer + total, len - total);
        if (result.is_error()) {
            return result;
        }
        if (result.value() == 0) {
            break;
        }
        total += result.value();
    }
    return Ok(total);
}

Result<std::uint64_t> copy_stream(InputStream& in, OutputSink& out) {
    std::array<std::uint8_t, 32 * 1024> buffer{};
    std::uint64_t total = 0;
    for (;;) {
        auto result = in.read(buffer.data(), buffer.size());
        if (result.is_error()) {
            return Err<std::uint64_t>(result.error());
        }
        const auto n = result.value();
        if (n == 0) {
            return Ok(total);
        }
        if (auto written = out.write(buffer.data(), n); written.is_error()) {
            return Err<std::uint64_t>(written.error());
        }
        total += n;
    }
}

// ──────────────────────────────────────────────────────────
// MemoryStream
// ──────────────────────────────────────────────────────────

MemoryStream::MemoryStream(std::vector<std::uint8_t> data)
    : data_(std::make_shared<const std::vector<std::uint8_t>>(std::move(data))) {
}

MemoryStream::MemoryStream(const std::string& data)
    : data_(std::make_shared<const std::vector<std::uint8_t>>(data.begin(), data.end())) {
}

MemoryStream::MemoryStream(std::shared_ptr<const std::vector<std::uint8_t>> data)
    : data_(std::move(data)) {
}

Result<std::size_t> MemoryStream::read(std::uint8_t* buffer, std::size_t len) {
    std::lock_guard lock(mutex_);
    auto result = read_at(buffer, len, position_);
    if (result.is_ok()) {
        position_ += result.value();
    }
    return result;
}

Result<std::size_t> MemoryStream::read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) {
    if (offset >= data_->size()) {
        return Ok<std::size_t>(0);
    }
    const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(len, data_->size() - offset));
    std::memcpy(buffer, data_->data() + offset, n);
    return Ok(n);
}

std::uint64_t MemoryStream::tell() const {
    std::lock_guard lock(mutex_);
    return position_;
}

Result<void> MemoryStream::seek(std::uint64_t offset) {
    std::lock_guard lock(mutex_);
    if (offset > data_->size()) {
        return Err<void>(ErrorCode::InvalidArgument, "seek past end of memory stream");
    }
    position_ = offset;
    return Ok();
}

// ──────────────────────────────────────────────────────────
// IStreamInput / OStreamSink
// ──────────────────────────────────────────────────────────

Result<std::size_t> IStreamInput::read(std::uint8_t* buffer, std::size_t len) {
    if (len == 0 || in_.eof()) {
        return Ok<std::size_t>(0);
    }
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
    const auto n = static_cast<std::size_t>(in_.gcount());
    if (in_.bad()) {
        return Err<std::size_t>(ErrorCode::Io, "input stream read failed");
    }
    return Ok(n);
}

Result<void> OStreamSink::write(const std::uint8_t* data, std::size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out_) {
        return Err<void>(ErrorCode::Io, "output stream write failed");
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// FileSource
// ──────────────────────────────────────────────────────────

FileSource::FileSource(fs::path path, std::uint64_t size)
    : path_(std::move(path))
    , size_(size)
    , stream_(path_, std::ios::binary) {
}

Result<std::shared_ptr<FileSource>> FileSource::open(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::shared_ptr<FileSource>>(ErrorCode::Io,
            "Failed to stat " + path.string() + ": " + ec.message());
    }
    std::shared_ptr<FileSource> source(new FileSource(path, size));
    if (!source->stream_) {
        return Err<std::shared_ptr<FileSource>>(ErrorCode::Io, "Failed to open " + path.string());
    }
    return Ok(std::move(source));
}

Result<std::size_t> FileSource::read(std::uint8_t* buffer, std::size_t len) {
    std::lock_guard lock(mutex_);
    auto result = read_locked(buffer, len, position_);
    if (result.is_ok()) {
        position_ += result.value();
    }
    return result;
}

Result<std::size_t> FileSource::read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) {
    std::lock_guard lock(mutex_);
    return read_locked(buffer, len, offset);
}

Result<std::size_t> FileSource::read_locked(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) {
    if (offset >= size_ || len == 0) {
        return Ok<std::size_t>(0);
    }
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(len, size_ - offset));
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(stream_.gcount());
    if (stream_.bad() || (got == 0 && want > 0)) {
        return Err<std::size_t>(ErrorCode::Io, "Failed to read " + path_.string() +
                                " at offset " + std::to_string(offset));
    }
    return Ok(got);
}

std::uint64_t FileSource::tell() const {
    std::lock_guard lock(mutex_);
    return position_;
}

Result<void> FileSource::seek(std::uint64_t offset) {
    std::lock_guard lock(mutex_);
    if (offset > size_) {
        return Err<void>(ErrorCode::InvalidArgument, "seek past end of " + path_.string());
    }
    position_ = offset;
    return Ok();
}

} // namespace flowfile

#pragma once

#include "flowfile/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace flowfile {

/**
 * @brief Forward-only byte source
 *
 * read() returns the number of bytes copied into @p buffer; 0 means the
 * source is exhausted. Implementations may return fewer bytes than asked.
 */
class InputStream {
public:
    virtual ~InputStream() = default;
    virtual Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) = 0;
};

/**
 * @brief Randomly addressable byte source
 *
 * read_at() never moves any shared cursor, so several Files may share one
 * source at disjoint windows and read it from different threads.
 */
class RandomAccessSource {
public:
    virtual ~RandomAccessSource() = default;
    virtual Result<std::size_t> read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) = 0;
    virtual std::uint64_t size() const = 0;
};

/**
 * @brief A stream with a cursor that can also be read at arbitrary offsets
 *
 * The wire decoder binds records read from a SeekableStream as random-access
 * windows instead of sequential ones, which keeps them resettable.
 */
class SeekableStream : public InputStream, public RandomAccessSource {
public:
    virtual std::uint64_t tell() const = 0;
    virtual Result<void> seek(std::uint64_t offset) = 0;
};

class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual Result<void> write(const std::uint8_t* data, std::size_t len) = 0;
};

/// Reads until @p len bytes arrived or the source ended; returns the count read.
Result<std::size_t> read_full(InputStream& in, std::uint8_t* buffer, std::size_t len);

/// Copies everything @p in yields into @p out; returns the byte count.
Result<std::uint64_t> copy_stream(InputStream& in, OutputSink& out);

// ──────────────────────────────────────────────────────────
// In-memory implementations
// ──────────────────────────────────────────────────────────

class MemoryStream : public SeekableStream {
public:
    explicit MemoryStream(std::vector<std::uint8_t> data);
    explicit MemoryStream(const std::string& data);
    explicit MemoryStream(std::shared_ptr<const std::vector<std::uint8_t>> data);

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;
    Result<std::size_t> read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) override;
    std::uint64_t size() const override { return data_->size(); }
    std::uint64_t tell() const override;
    Result<void> seek(std::uint64_t offset) override;

private:
    std::shared_ptr<const std::vector<std::uint8_t>> data_;
    mutable std::mutex mutex_;
    std::uint64_t position_ = 0;
};

/// Sequential view of a std::istream (stdin, sockets wrapped in streambufs, ...).
class IStreamInput : public InputStream {
public:
    explicit IStreamInput(std::istream& in) : in_(in) {}

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;

private:
    std::istream& in_;
};

/// Hides any random-access capability of the wrapped stream.
class SequentialOnly : public InputStream {
public:
    explicit SequentialOnly(std::shared_ptr<InputStream> inner) : inner_(std::move(inner)) {}

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override {
        return inner_->read(buffer, len);
    }

private:
    std::shared_ptr<InputStream> inner_;
};

// ──────────────────────────────────────────────────────────
// On-disk implementation
// ──────────────────────────────────────────────────────────

class FileSource : public SeekableStream {
public:
    static Result<std::shared_ptr<FileSource>> open(const std::filesystem::path& path);

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;
    Result<std::size_t> read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) override;
    std::uint64_t size() const override { return size_; }
    std::uint64_t tell() const override;
    Result<void> seek(std::uint64_t offset) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileSource(std::filesystem::path path, std::uint64_t size);

    Result<std::size_t> read_locked(std::uint8_t* buffer, std::size_t len, std::uint64_t offset);

    std::filesystem::path path_;
    std::uint64_t size_;
    std::ifstream stream_;
    mutable std::mutex mutex_;
    std::uint64_t position_ = 0;
};

// ──────────────────────────────────────────────────────────
// Sinks
// ──────────────────────────────────────────────────────────

class VectorSink : public OutputSink {
public:
    Result<void> write(const std::uint8_t* data, std::size_t len) override {
        data_.insert(data_.end(), data, data + len);
        return Ok();
    }

    const std::vector<std::uint8_t>& data() const noexcept { return data_; }
    std::vector<std::uint8_t> take() { return std::move(data_); }
    std::string str() const { return std::string(data_.begin(), data_.end()); }

private:
    std::vector<std::uint8_t> data_;
};

class OStreamSink : public OutputSink {
public:
    explicit OStreamSink(std::ostream& out) : out_(out) {}

    Result<void> write(const std::uint8_t* data, std::size_t len) override;

private:
    std::ostream& out_;
};

class DiscardSink : public OutputSink {
public:
    Result<void> write(const std::uint8_t*, std::size_t) override { return Ok(); }
};

} // namespace flowfile

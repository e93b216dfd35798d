#pragma once

#include "flowfile/checksum/hasher.hpp"
#include "flowfile/core/attributes.hpp"
#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowfile {

/**
 * @brief Progress of the content checksum attached to a File
 *
 * Uninitialized -> Computing   (first read, checksumType known)
 * Uninitialized -> Unverified  (first read, no usable checksumType)
 * Computing     -> Passed | Failed
 *
 * Passed, Failed and Unverified are terminal.
 */
enum class ChecksumState {
    Uninitialized,
    Computing,
    Passed,
    Failed,
    Unverified
};

const char* checksum_state_name(ChecksumState state) noexcept;
bool checksum_transition_allowed(ChecksumState from, ChecksumState to) noexcept;

/**
 * @brief One FlowFile in flight: attributes plus a length-delimited payload
 *
 * The payload comes from exactly one backing:
 * - Sequential: a forward-only stream, read once; close() drains what is left
 *   so a shared stream stays aligned on the next record.
 * - RandomAccess: a window [offset, offset + size) of a random-access source;
 *   resettable, and several Files can share one source.
 * - DeferredPath: a file on disk opened on first read and released on close.
 *
 * Attributes are meant to be edited before the first byte is read or sent.
 * Files are move-only; a moved-from File reads as empty and closed.
 */
class File {
public:
    struct Sequential {
        std::shared_ptr<InputStream> stream;
    };
    struct RandomAccess {
        std::shared_ptr<RandomAccessSource> source;
        std::uint64_t offset = 0;
    };
    struct DeferredPath {
        std::filesystem::path path;
        std::shared_ptr<RandomAccessSource> opened;
    };
    using Backing = std::variant<Sequential, RandomAccess, DeferredPath>;

    enum class BackingKind { Sequential, RandomAccess, DeferredPath };

    File();
    File(std::shared_ptr<InputStream> stream, std::uint64_t size);
    File(std::shared_ptr<RandomAccessSource> source, std::uint64_t offset, std::uint64_t size);

    static File from_bytes(std::vector<std::uint8_t> data);
    static File from_string(const std::string& data);

    /**
     * @brief File for a path on disk, opened lazily
     *
     * Records path, filename, file.lastModifiedTime, file.creationTime and a
     * fresh uuid; regular files also get file.permissions, directories
     * kind=dir and symlinks kind=link plus target.
     */
    static Result<File> from_path(const std::filesystem::path& path);

    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;
    File(const File&) = delete;
    File& operator=(const File&) = delete;
    ~File();

    AttributeSet& attrs() noexcept { return attrs_; }
    const AttributeSet& attrs() const noexcept { return attrs_; }

    std::uint64_t size() const noexcept { return size_; }
    std::uint64_t remaining() const noexcept { return remaining_; }
    std::uint64_t position() const noexcept { return size_ - remaining_; }

    BackingKind kind() const noexcept;
    bool can_reset() const noexcept { return size_ == 0 || (kind() != BackingKind::Sequential && !exhausted_); }
    bool can_read_at() const noexcept { return kind() != BackingKind::Sequential; }
    bool closed() const noexcept { return closed_; }

    /// Path of a DeferredPath backing, empty otherwise.
    std::filesystem::path file_path() const;

    /**
     * @brief Read up to @p len content bytes
     *
     * Returns 0 once the declared size has been consumed. Bytes returned are
     * fed into the running checksum, if any.
     */
    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len);

    /// Read within the window without touching the cursor or the checksum.
    Result<std::size_t> read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset);

    /// Rewind to the start of the window; NotResettable for sequential backings.
    Result<void> reset();

    /// Stop reading; drains a sequential source. Safe to call repeatedly.
    Result<void> close();

    /// Compare the digest of what was read against the checksum attribute.
    Result<void> verify();
    ChecksumState checksum_state() const noexcept { return checksum_state_; }

    /**
     * @brief Pull a not-yet-read sequential payload into memory
     *
     * Afterwards the File is random-access backed, so it can be checksummed,
     * segmented or replayed. No-op for backings that are already resettable.
     */
    Result<void> buffer();

    /// Shared random-access source and window offset (opens a deferred path).
    Result<std::shared_ptr<RandomAccessSource>> shared_source();
    std::uint64_t window_offset() const noexcept;

    /// Marks the content consumed without reading it; reset() refuses afterwards.
    void exhaust() noexcept {
        remaining_ = 0;
        exhausted_ = true;
    }

private:
    void init_checksum();
    void transition(ChecksumState next);
    Result<std::size_t> read_backing(std::uint8_t* buffer, std::size_t len, std::uint64_t offset);

    AttributeSet attrs_;
    std::uint64_t size_ = 0;
    std::uint64_t remaining_ = 0;
    Backing backing_;
    bool closed_ = false;
    bool exhausted_ = false;

    ChecksumState checksum_state_ = ChecksumState::Uninitialized;
    std::unique_ptr<checksum::Hasher> hasher_;
    std::optional<Error> checksum_error_;
};

} // namespace flowfile

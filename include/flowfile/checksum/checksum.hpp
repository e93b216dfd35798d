#pragma once

#include "flowfile/checksum/hasher.hpp"
#include "flowfile/core/attributes.hpp"
#include "flowfile/core/buffer_pool.hpp"
#include "flowfile/core/file.hpp"
#include "flowfile/core/result.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace flowfile::checksum {

/**
 * @brief Binds content digests to FlowFile metadata
 *
 * Scratch buffers come from the injected pool, so concurrent callers share a
 * bounded amount of memory.
 */
class ChecksumEngine {
public:
    explicit ChecksumEngine(std::shared_ptr<BufferPool> pool = std::make_shared<BufferPool>());

    /**
     * @brief Hash the whole window of @p file and stamp checksumType/checksum
     *
     * Requires a random-access or path backing (NotSeekable otherwise). The
     * read cursor of @p file does not move.
     */
    Result<void> add_checksum(File& file, const std::string& algorithm);

    /// Digest of a window of @p source.
    Result<std::string> hash_window(RandomAccessSource& source, std::uint64_t offset,
                                    std::uint64_t length, const std::string& algorithm);

    /// Digest of a whole file on disk.
    Result<std::string> hash_file(const std::filesystem::path& path, const std::string& algorithm);

    /**
     * @brief Re-hash a reassembled file and compare it with its parent checksum
     *
     * Uses segment.original.checksumType and segment.original.checksum from
     * @p attrs. ChecksumMissing when the parent carried no checksum.
     */
    Result<void> verify_parent(const std::filesystem::path& path, const AttributeSet& attrs);

    const std::shared_ptr<BufferPool>& pool() const noexcept { return pool_; }

private:
    std::shared_ptr<BufferPool> pool_;
};

} // namespace flowfile::checksum

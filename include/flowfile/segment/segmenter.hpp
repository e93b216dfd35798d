#pragma once

#include "flowfile/core/file.hpp"
#include "flowfile/core/result.hpp"

#include <cstdint>
#include <vector>

namespace flowfile::segment {

/**
 * @brief Split @p in into windows of at most @p segment_size bytes
 *
 * Requires a random-access or path backing. A file that fits in one segment
 * is moved into a one-element result unchanged. Otherwise every fragment
 * shares the parent's source and carries:
 *   uuid (fresh), fragment.identifier (parent uuid), fragment.offset,
 *   fragment.index (1-based), fragment.count, segment.original.size,
 *   segment.original.filename and, when the parent had one,
 *   segment.original.checksumType / segment.original.checksum.
 * The parent's own checksum/checksumType are not copied. @p in is left
 * exhausted.
 */
Result<std::vector<File>> segment_by_size(File& in, std::uint64_t segment_size);

/// Split @p in into @p count pieces of near-equal size.
Result<std::vector<File>> segment(File& in, std::uint64_t count);

/// True when @p attrs describe a fragment of a larger file.
bool is_fragment(const AttributeSet& attrs);

} // namespace flowfile::segment

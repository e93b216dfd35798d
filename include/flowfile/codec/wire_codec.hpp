#pragma once

#include "flowfile/core/file.hpp"
#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace flowfile::codec {

/// Size of the big-endian content length that follows the attribute block.
inline constexpr std::size_t kSizeFieldLength = 8;

/**
 * @brief Frame one File onto @p out
 *
 * Writes the attribute block, the 8-byte content size and exactly size()
 * content bytes pulled through File::read(), so a running checksum sees the
 * payload. A source that ends early is reported as Malformed.
 */
Result<void> encode(File& file, OutputSink& out);

/// Writes the "NiFiEOF" end-of-stream sentinel.
Result<void> write_eof(OutputSink& out);

/**
 * @brief Decode the next record header from @p in and bind a File to its content
 *
 * Content is never read eagerly. When @p in is a SeekableStream the File is a
 * random-access window starting at the current cursor; otherwise it reads
 * @p in sequentially and must be drained (File::close) before the next decode.
 *
 * Errors: EndOfStream when the input is cleanly exhausted, NoHeader or
 * Malformed for framing problems.
 */
Result<File> decode(const std::shared_ptr<InputStream>& in);

/// encode() into a fresh byte vector.
Result<std::vector<std::uint8_t>> encode_to_bytes(File& file);

/// Decode exactly one record held in memory; trailing bytes are Malformed.
Result<File> decode_from_bytes(std::vector<std::uint8_t> data);

} // namespace flowfile::codec

#include "flowfile/codec/wire_codec.hpp"
#include "flowfile/core/byte_order.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace flowfile::codec {

Result<void> encode(File& file, OutputSink& out) {
    if (auto header = file.attrs().write_to(out); header.is_error()) {
        return header;
    }

    std::uint8_t size_buf[kSizeFieldLength];
    store_be64(size_buf, file.size());
    if (auto written = out.write(size_buf, sizeof(size_buf)); written.is_error()) {
        return written;
    }

    std::array<std::uint8_t, 32 * 1024> buffer{};
    std::uint64_t sent = 0;
    while (sent < file.size()) {
        auto got = file.read(buffer.data(), buffer.size());
        if (got.is_error()) {
            return Err<void>(got.error());
        }
        if (got.value() == 0) {
            return Err<void>(ErrorCode::Malformed,
                "Mismatching size, expected " + std::to_string(file.size()) +
                " but only " + std::to_string(sent) + " were available");
        }
        if (auto written = out.write(buffer.data(), got.value()); written.is_error()) {
            return written;
        }
        sent += got.value();
    }
    return Ok();
}

Result<void> write_eof(OutputSink& out) {
    return out.write(reinterpret_cast<const std::uint8_t*>(AttributeSet::kEofMagic),
                     AttributeSet::kMagicSize);
}

Result<File> decode(const std::shared_ptr<InputStream>& in) {
    if (!in) {
        return Err<File>(ErrorCode::InvalidArgument, "decode from a null stream");
    }

    AttributeSet attrs;
    if (auto header = attrs.read_from(*in); header.is_error()) {
        return Err<File>(header.error());
    }

    std::uint8_t size_buf[kSizeFieldLength];
    auto got = read_full(*in, size_buf, sizeof(size_buf));
    if (got.is_error()) {
        return Err<File>(ErrorCode::Malformed, "Error reading content size: " + got.error().message);
    }
    if (got.value() != sizeof(size_buf)) {
        return Err<File>(ErrorCode::Malformed, "Truncated content size");
    }
    const std::uint64_t size = load_be64(size_buf);

    File file;
    if (auto seekable = std::dynamic_pointer_cast<SeekableStream>(in)) {
        const std::uint64_t offset = seekable->tell();
        if (offset > seekable->size() || seekable->size() - offset < size) {
            return Err<File>(ErrorCode::Malformed,
                "Content of " + std::to_string(size) + " bytes exceeds the remaining " +
                std::to_string(seekable->size() - std::min(offset, seekable->size())) + " bytes");
        }
        file = File(std::static_pointer_cast<RandomAccessSource>(seekable), offset, size);
    } else {
        file = File(in, size);
    }
    file.attrs() = std::move(attrs);
    spdlog::debug("Decoded FlowFile {} ({} attributes, {} bytes)",
                  file.attrs().get(attr::kFilename), file.attrs().size(), size);
    return Ok(std::move(file));
}

Result<std::vector<std::uint8_t>> encode_to_bytes(File& file) {
    VectorSink sink;
    if (auto encoded = encode(file, sink); encoded.is_error()) {
        return Err<std::vector<std::uint8_t>>(encoded.error());
    }
    return Ok(sink.take());
}

Result<File> decode_from_bytes(std::vector<std::uint8_t> data) {
    auto stream = std::make_shared<MemoryStream>(std::move(data));
    auto decoded = decode(stream);
    if (decoded.is_error()) {
        return decoded;
    }
    const auto end = stream->tell() + decoded.value().size();
    if (end != stream->size()) {
        return Err<File>(ErrorCode::Malformed,
            std::to_string(stream->size() - end) + " trailing bytes after the record");
    }
    return decoded;
}

} // namespace flowfile::codec

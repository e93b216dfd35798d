#include "flowfile/segment/segmenter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace flowfile::segment {

bool is_fragment(const AttributeSet& attrs) {
    return attrs.has(attr::kOriginalSize);
}

Result<std::vector<File>> segment_by_size(File& in, std::uint64_t segment_size) {
    if (!in.can_read_at()) {
        return Err<std::vector<File>>(ErrorCode::NotSeekable,
            "Must have a reader with ReadAt capabilities to segment");
    }
    if (segment_size == 0) {
        return Err<std::vector<File>>(ErrorCode::InvalidArgument, "Segment size must be positive");
    }

    std::vector<File> out;
    if (in.size() <= segment_size) {
        out.push_back(std::move(in));
        return Ok(std::move(out));
    }

    auto source = in.shared_source();
    if (source.is_error()) {
        return Err<std::vector<File>>(source.error());
    }

    const std::uint64_t size = in.size();
    const std::uint64_t count = (size - 1) / segment_size + 1;
    const std::uint64_t base = in.window_offset();

    std::string parent_uuid = in.attrs().get(attr::kUuid);
    if (parent_uuid.empty()) {
        parent_uuid = in.attrs().generate_uuid();
    }

    AttributeSet shared = in.attrs().clone();
    shared.unset(attr::kChecksum);
    shared.unset(attr::kChecksumType);
    shared.set(attr::kFragmentIdentifier, parent_uuid);
    shared.set(attr::kFragmentCount, std::to_string(count));
    shared.set(attr::kOriginalSize, std::to_string(size));
    shared.set(attr::kOriginalFilename, in.attrs().get(attr::kFilename));
    if (in.attrs().has(attr::kChecksum)) {
        shared.set(attr::kOriginalChecksumType, in.attrs().get(attr::kChecksumType));
        shared.set(attr::kOriginalChecksum, in.attrs().get(attr::kChecksum));
    }

    out.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = segment_size * i;
        const std::uint64_t end = std::min(size, start + segment_size);

        File fragment(source.value(), base + start, end - start);
        fragment.attrs() = shared.clone();
        fragment.attrs().generate_uuid();
        fragment.attrs().set(attr::kFragmentOffset, std::to_string(start));
        fragment.attrs().set(attr::kFragmentIndex, std::to_string(i + 1));
        out.push_back(std::move(fragment));
    }

    in.exhaust();
    spdlog::debug("Segmented {} ({} bytes) into {} fragments of up to {} bytes",
                  parent_uuid, size, count, segment_size);
    return Ok(std::move(out));
}

Result<std::vector<File>> segment(File& in, std::uint64_t count) {
    if (count == 0) {
        return Err<std::vector<File>>(ErrorCode::InvalidArgument, "Segment count must be positive");
    }
    const std::uint64_t size = in.size();
    std::uint64_t segment_size = size / count;
    if (size % count > 0) {
        ++segment_size;
    }
    return segment_by_size(in, std::max<std::uint64_t>(segment_size, 1));
}

} // namespace flowfile::segment

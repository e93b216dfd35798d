#include "flowfile/checksum/checksum.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace flowfile::checksum {
namespace {

bool same_digest(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

ChecksumEngine::ChecksumEngine(std::shared_ptr<BufferPool> pool)
    : pool_(std::move(pool)) {
    if (!pool_) {
        pool_ = std::make_shared<BufferPool>();
    }
}

Result<std::string> ChecksumEngine::hash_window(RandomAccessSource& source, std::uint64_t offset,
                                                std::uint64_t length, const std::string& algorithm) {
    auto hasher = Hasher::create(algorithm);
    if (hasher.is_error()) {
        return Err<std::string>(hasher.error());
    }

    auto lease = pool_->acquire();
    std::uint64_t done = 0;
    while (done < length) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(lease.size(), length - done));
        auto got = source.read_at(lease.data(), want, offset + done);
        if (got.is_error()) {
            return Err<std::string>(got.error());
        }
        if (got.value() == 0) {
            return Err<std::string>(ErrorCode::Io,
                "Source ended " + std::to_string(length - done) + " bytes short of the window");
        }
        if (auto fed = hasher.value()->update(lease.data(), got.value()); fed.is_error()) {
            return Err<std::string>(fed.error());
        }
        done += got.value();
    }
    return hasher.value()->hex_digest();
}

Result<void> ChecksumEngine::add_checksum(File& file, const std::string& algorithm) {
    const std::string canonical = canonical_name(algorithm);
    if (canonical.empty()) {
        return Err<void>(ErrorCode::UnknownChecksum, "Unable to find checksum type: \"" + algorithm + "\"");
    }
    if (!file.can_read_at()) {
        return Err<void>(ErrorCode::NotSeekable, "Reader must implement a ReadAt interface");
    }

    auto source = file.shared_source();
    if (source.is_error()) {
        return Err<void>(source.error());
    }
    auto digest = hash_window(*source.value(), file.window_offset(), file.size(), canonical);
    if (digest.is_error()) {
        return Err<void>(digest.error());
    }

    file.attrs().set(attr::kChecksumType, canonical);
    file.attrs().set(attr::kChecksum, digest.value());
    return Ok();
}

Result<std::string> ChecksumEngine::hash_file(const std::filesystem::path& path, const std::string& algorithm) {
    auto source = FileSource::open(path);
    if (source.is_error()) {
        return Err<std::string>(source.error());
    }
    return hash_window(*source.value(), 0, source.value()->size(), algorithm);
}

Result<void> ChecksumEngine::verify_parent(const std::filesystem::path& path, const AttributeSet& attrs) {
    const std::string type = attrs.get(attr::kOriginalChecksumType);
    const std::string expected = attrs.get(attr::kOriginalChecksum);
    if (type.empty() || expected.empty()) {
        return Err<void>(ErrorCode::ChecksumMissing, "Missing parent checksum for " + path.string());
    }

    auto digest = hash_file(path, type);
    if (digest.is_error()) {
        return Err<void>(digest.error());
    }
    if (!same_digest(digest.value(), expected)) {
        spdlog::warn("Reassembled file {} does not match its {} checksum", path.string(), type);
        return Err<void>(ErrorCode::ChecksumMismatch, "Mismatching checksum for " + path.string());
    }
    return Ok();
}

} // namespace flowfile::checksum

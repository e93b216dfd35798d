#include "flowfile/segment/save.hpp"
#include "flowfile/core/time_util.hpp"
#include "flowfile/segment/segmenter.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <thread>

namespace flowfile::segment {
namespace fs = std::filesystem;
namespace {

Result<std::uint64_t> parse_u64(const AttributeSet& attrs, const char* name) {
    const std::string text = attrs.get(name);
    std::uint64_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && end == text.data() + text.size() && !text.empty()) {
        return Ok(value);
    }
    return Err<std::uint64_t>(ErrorCode::Malformed, std::string("Invalid ") + name + ": \"" + text + "\"");
}

bool escapes(const fs::path& normalized) {
    return !normalized.empty() && *normalized.begin() == "..";
}

Result<void> copy_content(File& file, std::ostream& out, const fs::path& target) {
    std::array<std::uint8_t, 32 * 1024> buffer{};
    for (;;) {
        auto got = file.read(buffer.data(), buffer.size());
        if (got.is_error()) {
            return Err<void>(got.error());
        }
        if (got.value() == 0) {
            return Ok();
        }
        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(got.value()));
        if (!out) {
            return Err<void>(ErrorCode::Io, "Failed to write " + target.string());
        }
    }
}

Result<void> verify_content(File& file, bool require_checksum) {
    if (file.size() == 0) {
        return Ok();
    }
    auto verified = file.verify();
    if (verified.is_error() && verified.error().is(ErrorCode::ChecksumMissing) && !require_checksum) {
        return Ok();
    }
    return verified;
}

Result<void> save_whole(File& file, const fs::path& target, const SaveOptions& options) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to create " + target.string());
    }
    if (auto copied = copy_content(file, out, target); copied.is_error()) {
        return copied;
    }
    out.flush();
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to flush " + target.string());
    }
    return verify_content(file, options.require_checksum);
}

// The first sibling to arrive creates the target and extends it with zeros.
Result<void> precreate(const fs::path& target, std::uint64_t full_size) {
    const int fd = ::open(target.c_str(), O_RDWR | O_CREAT | O_EXCL, 0666);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Ok();
        }
        return Err<void>(ErrorCode::Io, "Failed to create " + target.string() + ": " + std::strerror(errno));
    }
    const int rc = ::ftruncate(fd, static_cast<off_t>(full_size));
    const int saved = errno;
    ::close(fd);
    if (rc != 0) {
        return Err<void>(ErrorCode::Io, "Failed to size " + target.string() + ": " + std::strerror(saved));
    }
    return Ok();
}

Result<void> await_full_size(const fs::path& target, std::uint64_t full_size, const SaveOptions& options) {
    for (int attempt = 0;; ++attempt) {
        std::error_code ec;
        const auto current = fs::file_size(target, ec);
        if (!ec && current == full_size) {
            return Ok();
        }
        if (!ec && current > full_size) {
            return Err<void>(ErrorCode::Io, target.string() + " is larger than the original size " +
                             std::to_string(full_size));
        }
        if (attempt >= options.reassembly_attempts) {
            return Err<void>(ErrorCode::ReassemblyTimeout,
                "Gave up waiting for " + target.string() + " to reach " + std::to_string(full_size) + " bytes");
        }
        spdlog::debug("Waiting for {} to reach {} bytes (attempt {})", target.string(), full_size, attempt + 1);
        std::this_thread::sleep_for(options.reassembly_delay);
    }
}

Result<void> save_fragment(File& file, const fs::path& target, const SaveOptions& options) {
    auto full_size = parse_u64(file.attrs(), attr::kOriginalSize);
    if (full_size.is_error()) {
        return Err<void>(full_size.error());
    }
    auto offset = parse_u64(file.attrs(), attr::kFragmentOffset);
    if (offset.is_error()) {
        return Err<void>(offset.error());
    }
    if (offset.value() > full_size.value() || full_size.value() - offset.value() < file.size()) {
        return Err<void>(ErrorCode::Malformed, "Fragment window exceeds the original size");
    }

    if (auto created = precreate(target, full_size.value()); created.is_error()) {
        return created;
    }
    if (auto ready = await_full_size(target, full_size.value(), options); ready.is_error()) {
        return ready;
    }

    std::fstream out(target, std::ios::in | std::ios::out | std::ios::binary);
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to open " + target.string());
    }
    out.seekp(static_cast<std::streamoff>(offset.value()));
    if (!out) {
        return Err<void>(ErrorCode::Io, "Not able to seek to offset " + std::to_string(offset.value()));
    }
    if (auto copied = copy_content(file, out, target); copied.is_error()) {
        return copied;
    }
    out.flush();
    if (!out) {
        return Err<void>(ErrorCode::Io, "Failed to flush " + target.string());
    }

    // A fragment's own checksum is optional; the parent checksum is checked after reassembly.
    if (file.attrs().has(attr::kChecksum) && file.size() > 0) {
        return file.verify();
    }
    return Ok();
}

void apply_mtime(const fs::path& target, const std::string& stamp) {
    if (stamp.empty()) {
        return;
    }
    const auto parsed = parse_rfc3339(stamp);
    if (!parsed) {
        spdlog::debug("Ignoring unparsable {} \"{}\"", attr::kLastModifiedTime, stamp);
        return;
    }
    struct timespec times[2];
    times[0].tv_sec = *parsed;
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0) {
        spdlog::warn("Unable to set modification time of {}: {}", target.string(), std::strerror(errno));
    }
}

} // namespace

Result<fs::path> save(File& file, const fs::path& base_dir, const SaveOptions& options) {
    const fs::path base = base_dir.lexically_normal();
    fs::path dir = fs::path(file.attrs().get(attr::kPath)).relative_path().lexically_normal();
    if (escapes(dir)) {
        return Err<fs::path>(ErrorCode::InvalidArgument, "Invalid path \"" + dir.string() + "\"");
    }
    dir = (base / dir).lexically_normal();

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Err<fs::path>(ErrorCode::Io, "Failed to create " + dir.string() + ": " + ec.message());
    }

    const std::string filename = file.attrs().get(attr::kFilename);
    if (filename.empty() || filename == "." || filename == "..") {
        return Err<fs::path>(ErrorCode::InvalidArgument, "Missing or invalid filename");
    }
    const fs::path target = dir / filename;
    const std::string kind = file.attrs().get(attr::kKind);

    Result<void> written = Ok();
    if (kind.empty() || kind == "file") {
        written = is_fragment(file.attrs()) ? save_fragment(file, target, options)
                                            : save_whole(file, target, options);
    } else if (kind == "dir") {
        fs::create_directories(target, ec);
        if (ec) {
            written = Err<void>(ErrorCode::Io, "Failed to create " + target.string() + ": " + ec.message());
        }
    } else if (kind == "link") {
        const std::string link_target = file.attrs().get(attr::kTarget);
        const fs::path resolved = (dir / link_target).lexically_normal().lexically_relative(base);
        if (link_target.empty() || link_target[0] == '/' || escapes(resolved)) {
            spdlog::warn("Skipping link {} with invalid relative target \"{}\"", target.string(), link_target);
        } else {
            fs::create_symlink(link_target, target, ec);
            if (ec) {
                spdlog::warn("Symlink creation for {} failed: {}", target.string(), ec.message());
            }
        }
    } else {
        written = Err<void>(ErrorCode::InvalidArgument, "Unknown kind \"" + kind + "\"");
    }

    if (written.is_error()) {
        return Err<fs::path>(written.error());
    }
    if (kind != "link") {
        apply_mtime(target, file.attrs().get(attr::kLastModifiedTime));
    }
    return Ok(target);
}

} // namespace flowfile::segment

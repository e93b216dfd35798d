#include "flowfile/core/file.hpp"
#include "flowfile/core/time_util.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace flowfile {
namespace fs = std::filesystem;
namespace {

bool is_progressive(ChecksumState current, ChecksumState target) {
    static const std::unordered_map<ChecksumState, std::vector<ChecksumState>> transitions {
        {ChecksumState::Uninitialized, {ChecksumState::Computing, ChecksumState::Unverified}},
        {ChecksumState::Computing, {ChecksumState::Passed, ChecksumState::Failed}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

bool equal_hex(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string permission_string(const fs::file_status& status) {
    std::string out;
    switch (status.type()) {
        case fs::file_type::directory: out += 'd'; break;
        case fs::file_type::symlink: out += 'L'; break;
        default: out += '-'; break;
    }
    const auto p = status.permissions();
    const std::array<std::pair<fs::perms, char>, 9> bits {{
        {fs::perms::owner_read, 'r'}, {fs::perms::owner_write, 'w'}, {fs::perms::owner_exec, 'x'},
        {fs::perms::group_read, 'r'}, {fs::perms::group_write, 'w'}, {fs::perms::group_exec, 'x'},
        {fs::perms::others_read, 'r'}, {fs::perms::others_write, 'w'}, {fs::perms::others_exec, 'x'},
    }};
    for (const auto& [bit, c] : bits) {
        out += (p & bit) != fs::perms::none ? c : '-';
    }
    return out;
}

// Rewrites an absolute link target relative to the link's directory when the
// result stays inside that directory, so the link survives the transfer.
std::string portable_link_target(const fs::path& link, const fs::path& target) {
    if (!target.is_absolute()) {
        return target.string();
    }
    std::error_code ec;
    fs::path dir = link.parent_path().empty() ? fs::current_path(ec) : fs::absolute(link.parent_path(), ec);
    if (ec) {
        return target.string();
    }
    const fs::path rel = target.lexically_relative(dir);
    if (rel.empty() || *rel.begin() == "..") {
        return target.string();
    }
    return rel.string();
}

} // namespace

const char* checksum_state_name(ChecksumState state) noexcept {
    switch (state) {
        case ChecksumState::Uninitialized: return "uninitialized";
        case ChecksumState::Computing: return "computing";
        case ChecksumState::Passed: return "passed";
        case ChecksumState::Failed: return "failed";
        case ChecksumState::Unverified: return "unverified";
    }
    return "unknown";
}

bool checksum_transition_allowed(ChecksumState from, ChecksumState to) noexcept {
    return from == to || is_progressive(from, to);
}

File::File()
    : backing_(Sequential{})
    , closed_(true) {
}

File::File(std::shared_ptr<InputStream> stream, std::uint64_t size)
    : size_(size)
    , remaining_(size)
    , backing_(Sequential{std::move(stream)}) {
}

File::File(std::shared_ptr<RandomAccessSource> source, std::uint64_t offset, std::uint64_t size)
    : size_(size)
    , remaining_(size)
    , backing_(RandomAccess{std::move(source), offset}) {
}

File File::from_bytes(std::vector<std::uint8_t> data) {
    const auto size = data.size();
    return File(std::make_shared<MemoryStream>(std::move(data)), 0, size);
}

File File::from_string(const std::string& data) {
    return File(std::make_shared<MemoryStream>(data), 0, data.size());
}

Result<File> File::from_path(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec || status.type() == fs::file_type::not_found) {
        return Err<File>(ErrorCode::Io, "Unable to stat " + path.string() +
                         (ec ? ": " + ec.message() : std::string()));
    }

    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return Err<File>(ErrorCode::Io, "Unable to stat " + path.string());
    }

    File f;
    f.closed_ = false;
    f.backing_ = DeferredPath{path, nullptr};

    std::string dir = path.parent_path().string();
    dir = dir.empty() ? "./" : dir + "/";
    f.attrs_.set(attr::kPath, dir);
    f.attrs_.set(attr::kFilename, path.filename().string());
    const std::string mtime = format_rfc3339(st.st_mtime);
    f.attrs_.set(attr::kLastModifiedTime, mtime);
    // Birth time is not portably available; fall back to the modification time.
    f.attrs_.set(attr::kCreationTime, mtime);
    f.attrs_.generate_uuid();

    switch (status.type()) {
        case fs::file_type::regular:
            f.size_ = static_cast<std::uint64_t>(st.st_size);
            f.remaining_ = f.size_;
            f.attrs_.set(attr::kPermissions, permission_string(status));
            break;
        case fs::file_type::directory:
            f.attrs_.set(attr::kKind, "dir");
            break;
        case fs::file_type::symlink: {
            const auto target = fs::read_symlink(path, ec);
            if (ec) {
                return Err<File>(ErrorCode::Io, "Unable to read link " + path.string() + ": " + ec.message());
            }
            f.attrs_.set(attr::kKind, "link");
            f.attrs_.set(attr::kTarget, portable_link_target(path, target));
            break;
        }
        default:
            return Err<File>(ErrorCode::InvalidArgument, "Invalid file: \"" + path.string() + "\"");
    }
    return Ok(std::move(f));
}

File::File(File&& other) noexcept
    : attrs_(std::move(other.attrs_))
    , size_(other.size_)
    , remaining_(other.remaining_)
    , backing_(std::move(other.backing_))
    , closed_(other.closed_)
    , exhausted_(other.exhausted_)
    , checksum_state_(other.checksum_state_)
    , hasher_(std::move(other.hasher_))
    , checksum_error_(std::move(other.checksum_error_)) {
    other.size_ = 0;
    other.remaining_ = 0;
    other.closed_ = true;
}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        attrs_ = std::move(other.attrs_);
        size_ = other.size_;
        remaining_ = other.remaining_;
        backing_ = std::move(other.backing_);
        closed_ = other.closed_;
        exhausted_ = other.exhausted_;
        checksum_state_ = other.checksum_state_;
        hasher_ = std::move(other.hasher_);
        checksum_error_ = std::move(other.checksum_error_);
        other.size_ = 0;
        other.remaining_ = 0;
        other.closed_ = true;
    }
    return *this;
}

File::~File() = default;

File::BackingKind File::kind() const noexcept {
    switch (backing_.index()) {
        case 0: return BackingKind::Sequential;
        case 1: return BackingKind::RandomAccess;
        default: return BackingKind::DeferredPath;
    }
}

fs::path File::file_path() const {
    if (const auto* deferred = std::get_if<DeferredPath>(&backing_)) {
        return deferred->path;
    }
    return {};
}

std::uint64_t File::window_offset() const noexcept {
    if (const auto* ra = std::get_if<RandomAccess>(&backing_)) {
        return ra->offset;
    }
    return 0;
}

Result<std::shared_ptr<RandomAccessSource>> File::shared_source() {
    if (auto* ra = std::get_if<RandomAccess>(&backing_)) {
        return Ok(ra->source);
    }
    if (auto* deferred = std::get_if<DeferredPath>(&backing_)) {
        if (!deferred->opened) {
            auto opened = FileSource::open(deferred->path);
            if (opened.is_error()) {
                return Err<std::shared_ptr<RandomAccessSource>>(opened.error());
            }
            deferred->opened = opened.value();
        }
        return Ok(deferred->opened);
    }
    return Err<std::shared_ptr<RandomAccessSource>>(ErrorCode::NotSeekable,
        "Must have a reader with ReadAt capabilities");
}

Result<std::size_t> File::read_backing(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) {
    if (auto* seq = std::get_if<Sequential>(&backing_)) {
        if (!seq->stream) {
            return Err<std::size_t>(ErrorCode::Closed, "Missing underlying reader");
        }
        return seq->stream->read(buffer, len);
    }
    auto source = shared_source();
    if (source.is_error()) {
        return Err<std::size_t>(source.error());
    }
    return source.value()->read_at(buffer, len, window_offset() + offset);
}

Result<std::size_t> File::read(std::uint8_t* buffer, std::size_t len) {
    if (remaining_ == 0 || len == 0) {
        return Ok<std::size_t>(0);
    }
    if (closed_) {
        return Err<std::size_t>(ErrorCode::Closed, "read after close");
    }
    if (checksum_state_ == ChecksumState::Uninitialized) {
        init_checksum();
    }

    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(len, remaining_));
    auto result = read_backing(buffer, want, position());
    if (result.is_error()) {
        return result;
    }
    const auto n = result.value();
    if (n == 0) {
        return Err<std::size_t>(ErrorCode::Malformed,
            "unexpected end of content, " + std::to_string(remaining_) + " bytes missing");
    }

    remaining_ -= n;
    if (checksum_state_ == ChecksumState::Computing) {
        if (auto fed = hasher_->update(buffer, n); fed.is_error()) {
            checksum_error_ = fed.error();
            transition(ChecksumState::Failed);
            return Err<std::size_t>(fed.error());
        }
    }
    return Ok(n);
}

Result<std::size_t> File::read_at(std::uint8_t* buffer, std::size_t len, std::uint64_t offset) {
    if (kind() == BackingKind::Sequential) {
        return Err<std::size_t>(ErrorCode::NotSeekable, "Reader must implement a ReadAt interface");
    }
    if (offset >= size_) {
        return Ok<std::size_t>(0);
    }
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(len, size_ - offset));
    return read_backing(buffer, want, offset);
}

Result<void> File::reset() {
    if (size_ == 0) {
        return Ok();
    }
    if (kind() == BackingKind::Sequential) {
        return Err<void>(ErrorCode::NotResettable, "Unable to Reset a non-ReadAt reader");
    }
    if (exhausted_) {
        return Err<void>(ErrorCode::NotResettable, "Content was handed off and cannot be read again");
    }
    if (checksum_state_ == ChecksumState::Computing) {
        if (auto restarted = hasher_->reset(); restarted.is_error()) {
            return restarted;
        }
    }
    remaining_ = size_;
    closed_ = false;
    return Ok();
}

Result<void> File::close() {
    if (closed_) {
        return Ok();
    }
    closed_ = true;

    if (auto* seq = std::get_if<Sequential>(&backing_)) {
        if (remaining_ > 0 && seq->stream) {
            std::array<std::uint8_t, 32 * 1024> discard{};
            while (remaining_ > 0) {
                const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(discard.size(), remaining_));
                auto got = seq->stream->read(discard.data(), want);
                if (got.is_error()) {
                    return Err<void>(got.error());
                }
                if (got.value() == 0) {
                    const auto missing = remaining_;
                    remaining_ = 0;
                    return Err<void>(ErrorCode::Malformed,
                        "stream ended while discarding " + std::to_string(missing) + " bytes");
                }
                remaining_ -= got.value();
            }
        }
        return Ok();
    }

    if (auto* deferred = std::get_if<DeferredPath>(&backing_)) {
        deferred->opened.reset();
    }
    return Ok();
}

void File::transition(ChecksumState next) {
    if (!checksum_transition_allowed(checksum_state_, next)) {
        spdlog::warn("Illegal checksum state transition for {}", attrs_.get(attr::kFilename));
        return;
    }
    checksum_state_ = next;
}

void File::init_checksum() {
    const std::string type = attrs_.get(attr::kChecksumType);
    if (type.empty()) {
        transition(ChecksumState::Unverified);
        return;
    }
    auto hasher = checksum::Hasher::create(type);
    if (hasher.is_error()) {
        spdlog::debug("Checksum disabled for {}: {}", attrs_.get(attr::kFilename), hasher.error().message);
        checksum_error_ = hasher.error();
        transition(ChecksumState::Unverified);
        return;
    }
    hasher_ = std::move(hasher.value());
    transition(ChecksumState::Computing);
}

Result<void> File::verify() {
    if (size_ == 0) {
        return Ok();
    }
    switch (checksum_state_) {
        case ChecksumState::Computing: {
            const std::string expected = attrs_.get(attr::kChecksum);
            auto digest = hasher_->hex_digest();
            if (digest.is_error()) {
                checksum_error_ = digest.error();
                transition(ChecksumState::Failed);
                return Err<void>(digest.error());
            }
            if (!expected.empty() && equal_hex(digest.value(), expected)) {
                transition(ChecksumState::Passed);
                return Ok();
            }
            transition(ChecksumState::Failed);
            return Err<void>(ErrorCode::ChecksumMismatch, "Mismatching checksum");
        }
        case ChecksumState::Passed:
            return Ok();
        case ChecksumState::Failed:
            if (checksum_error_) {
                return Err<void>(*checksum_error_);
            }
            return Err<void>(ErrorCode::ChecksumMismatch, "Mismatching checksum");
        case ChecksumState::Unverified:
            if (checksum_error_) {
                return Err<void>(*checksum_error_);
            }
            return Err<void>(ErrorCode::ChecksumMissing, "Missing checksum");
        case ChecksumState::Uninitialized:
            break;
    }
    return Err<void>(ErrorCode::ChecksumMissing, "Missing checksum: content has not been read");
}

Result<void> File::buffer() {
    if (kind() != BackingKind::Sequential) {
        return Ok();
    }
    if (remaining_ != size_) {
        return Err<void>(ErrorCode::InvalidArgument, "File already started being read, cannot unread bytes");
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size_));
    std::size_t filled = 0;
    while (filled < data.size()) {
        auto got = read(data.data() + filled, data.size() - filled);
        if (got.is_error()) {
            return Err<void>(got.error());
        }
        filled += got.value();
    }

    // The digest covers the whole payload now; settle it so replays do not hash twice.
    if (checksum_state_ == ChecksumState::Computing) {
        auto verified = verify();
        if (verified.is_error()) {
            spdlog::debug("Buffered file {} failed verification: {}",
                          attrs_.get(attr::kFilename), verified.error().message);
        }
    }

    backing_ = RandomAccess{std::make_shared<MemoryStream>(std::move(data)), 0};
    remaining_ = size_;
    closed_ = false;
    return Ok();
}

} // namespace flowfile

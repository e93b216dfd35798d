#include "flowfile/network/body_stream.hpp"

#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <type_traits>

namespace flowfile {
namespace network {
namespace asio = boost::asio;
namespace {

template<typename Head>
Result<Head> read_head(SocketStream& stream, HttpParser::Mode mode) {
    HttpParser parser(mode);
    std::array<std::uint8_t, 8192> buffer{};
    for (;;) {
        auto got = stream.read(buffer.data(), buffer.size());
        if (got.is_error()) {
            return Err<Head>(got.error());
        }
        if (got.value() == 0) {
            return Err<Head>(ErrorCode::Transport, "Connection closed before the HTTP head was complete");
        }
        std::size_t consumed = 0;
        auto parsed = parser.parse(reinterpret_cast<const char*>(buffer.data()), got.value(), consumed);
        if (parsed.is_error()) {
            return Err<Head>(parsed.error());
        }
        if (parsed.value()) {
            stream.unread(buffer.data() + consumed, got.value() - consumed);
            if constexpr (std::is_same_v<Head, HttpRequest>) {
                return Ok(parser.request());
            } else {
                return Ok(parser.response());
            }
        }
    }
}

bool contains_token(const std::string& value, const std::string& token) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find(token) != std::string::npos;
}

} // namespace

// ──────────────────────────────────────────────────────────
// SocketStream
// ──────────────────────────────────────────────────────────

SocketStream::SocketStream(tcp::socket socket, std::shared_ptr<asio::io_context> context)
    : context_(std::move(context))
    , socket_(std::move(socket)) {
}

Result<std::size_t> SocketStream::read(std::uint8_t* buffer, std::size_t len) {
    if (len == 0) {
        return Ok<std::size_t>(0);
    }
    if (pending_pos_ < pending_.size()) {
        const auto n = std::min(len, pending_.size() - pending_pos_);
        std::memcpy(buffer, pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        if (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
        }
        return Ok(n);
    }

    // Small reads (framing lines) go through a read-ahead buffer.
    const bool read_ahead = len < kReadAhead;
    if (read_ahead) {
        pending_.resize(kReadAhead);
    }
    boost::system::error_code ec;
    const auto n = read_ahead ? socket_.read_some(asio::buffer(pending_), ec)
                              : socket_.read_some(asio::buffer(buffer, len), ec);
    if (ec == asio::error::eof) {
        pending_.clear();
        return Ok<std::size_t>(0);
    }
    if (ec) {
        pending_.clear();
        return Err<std::size_t>(ErrorCode::Transport, "Socket read failed: " + ec.message());
    }
    if (!read_ahead) {
        return Ok(n);
    }
    pending_.resize(n);
    const auto served = std::min(len, n);
    std::memcpy(buffer, pending_.data(), served);
    pending_pos_ = served;
    if (pending_pos_ == pending_.size()) {
        pending_.clear();
        pending_pos_ = 0;
    }
    return Ok(served);
}

Result<void> SocketStream::write(const std::uint8_t* data, std::size_t len) {
    boost::system::error_code ec;
    asio::write(socket_, asio::buffer(data, len), ec);
    if (ec) {
        return Err<void>(ErrorCode::Transport, "Socket write failed: " + ec.message());
    }
    return Ok();
}

void SocketStream::unread(const std::uint8_t* data, std::size_t len) {
    pending_.insert(pending_.begin() + static_cast<std::ptrdiff_t>(pending_pos_), data, data + len);
}

void SocketStream::shutdown() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
}

Result<HttpRequest> read_request_head(SocketStream& stream) {
    return read_head<HttpRequest>(stream, HttpParser::Mode::Request);
}

Result<HttpResponse> read_response_head(SocketStream& stream) {
    return read_head<HttpResponse>(stream, HttpParser::Mode::Response);
}

// ──────────────────────────────────────────────────────────
// Body decoders
// ──────────────────────────────────────────────────────────

Result<std::size_t> ContentLengthBody::read(std::uint8_t* buffer, std::size_t len) {
    if (remaining_ == 0 || len == 0) {
        return Ok<std::size_t>(0);
    }
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(len, remaining_));
    auto got = raw_->read(buffer, want);
    if (got.is_error()) {
        return got;
    }
    if (got.value() == 0) {
        return Err<std::size_t>(ErrorCode::Transport,
            "Connection closed with " + std::to_string(remaining_) + " body bytes outstanding");
    }
    remaining_ -= got.value();
    return got;
}

Result<std::string> ChunkedBody::read_line() {
    std::string line;
    std::uint8_t c = 0;
    for (;;) {
        auto got = raw_->read(&c, 1);
        if (got.is_error()) {
            return Err<std::string>(got.error());
        }
        if (got.value() == 0) {
            return Err<std::string>(ErrorCode::Transport, "Connection closed inside chunked framing");
        }
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return Ok(std::move(line));
        }
        line += static_cast<char>(c);
        if (line.size() > 4096) {
            return Err<std::string>(ErrorCode::Malformed, "Chunk header line too long");
        }
    }
}

Result<void> ChunkedBody::next_chunk() {
    if (need_crlf_) {
        auto crlf = read_line();
        if (crlf.is_error()) {
            return Err<void>(crlf.error());
        }
        if (!crlf.value().empty()) {
            return Err<void>(ErrorCode::Malformed, "Missing CRLF after chunk data");
        }
        need_crlf_ = false;
    }

    auto line = read_line();
    if (line.is_error()) {
        return Err<void>(line.error());
    }
    const std::string& text = line.value();
    const auto end = text.find(';');
    const std::string size_text = text.substr(0, end);
    std::uint64_t size = 0;
    const auto [ptr, ec] = std::from_chars(size_text.data(), size_text.data() + size_text.size(), size, 16);
    if (ec != std::errc() || size_text.empty() || ptr != size_text.data() + size_text.size()) {
        return Err<void>(ErrorCode::Malformed, "Invalid chunk size \"" + text + "\"");
    }

    if (size == 0) {
        // Trailer section ends with an empty line.
        for (;;) {
            auto trailer = read_line();
            if (trailer.is_error()) {
                return Err<void>(trailer.error());
            }
            if (trailer.value().empty()) {
                break;
            }
        }
        done_ = true;
        return Ok();
    }
    chunk_left_ = size;
    need_crlf_ = true;
    return Ok();
}

Result<std::size_t> ChunkedBody::read(std::uint8_t* buffer, std::size_t len) {
    if (len == 0) {
        return Ok<std::size_t>(0);
    }
    while (chunk_left_ == 0) {
        if (done_) {
            return Ok<std::size_t>(0);
        }
        if (auto next = next_chunk(); next.is_error()) {
            return Err<std::size_t>(next.error());
        }
    }

    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(len, chunk_left_));
    auto got = raw_->read(buffer, want);
    if (got.is_error()) {
        return got;
    }
    if (got.value() == 0) {
        return Err<std::size_t>(ErrorCode::Transport, "Connection closed inside a chunk");
    }
    chunk_left_ -= got.value();
    return got;
}

Result<void> ChunkedSink::write(const std::uint8_t* data, std::size_t len) {
    if (len == 0) {
        return Ok();
    }
    char size_line[32];
    const int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
    if (auto head = out_.write(reinterpret_cast<const std::uint8_t*>(size_line), static_cast<std::size_t>(n));
        head.is_error()) {
        return head;
    }
    if (auto body = out_.write(data, len); body.is_error()) {
        return body;
    }
    return out_.write(reinterpret_cast<const std::uint8_t*>("\r\n"), 2);
}

Result<void> ChunkedSink::finish() {
    return out_.write(reinterpret_cast<const std::uint8_t*>("0\r\n\r\n"), 5);
}

Result<std::uint64_t> parse_length(const std::string& value) {
    std::uint64_t length = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc() || value.empty() || ptr != value.data() + value.size()) {
        return Err<std::uint64_t>(ErrorCode::Malformed, "Invalid length \"" + value + "\"");
    }
    return Ok(length);
}

Result<std::shared_ptr<InputStream>> open_body(const std::shared_ptr<SocketStream>& stream,
                                               const HttpHeaders& headers, bool until_close) {
    using StreamPtr = std::shared_ptr<InputStream>;
    if (contains_token(headers.get("Transfer-Encoding"), "chunked")) {
        return Ok<StreamPtr>(std::make_shared<ChunkedBody>(stream));
    }
    if (headers.has("Content-Length")) {
        auto length = parse_length(headers.get("Content-Length"));
        if (length.is_error()) {
            return Err<StreamPtr>(length.error());
        }
        return Ok<StreamPtr>(std::make_shared<ContentLengthBody>(stream, length.value()));
    }
    if (until_close) {
        return Ok<StreamPtr>(stream);
    }
    return Ok<StreamPtr>(std::make_shared<ContentLengthBody>(stream, 0));
}

} // namespace network
} // namespace flowfile

#pragma once

#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"
#include "flowfile/network/http_parser.hpp"
#include "flowfile/network/http_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace flowfile {
namespace network {

using tcp = boost::asio::ip::tcp;

/**
 * @brief Blocking byte stream over a connected socket
 *
 * Bytes pushed back with unread() are served before the socket is read
 * again; the head reader uses this to hand the start of the body back.
 * A clean close by the peer reads as 0 (end of stream). @p context, when
 * given, is the io_context the socket was created on and is kept alive
 * for the socket's lifetime.
 */
class SocketStream : public InputStream, public OutputSink {
public:
    explicit SocketStream(tcp::socket socket, std::shared_ptr<boost::asio::io_context> context = nullptr);

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;
    Result<void> write(const std::uint8_t* data, std::size_t len) override;

    void unread(const std::uint8_t* data, std::size_t len);

    /// Shut down both directions; unblocks a reader on another thread.
    void shutdown();

    tcp::socket& socket() noexcept { return socket_; }

private:
    static constexpr std::size_t kReadAhead = 4096;

    std::shared_ptr<boost::asio::io_context> context_;
    tcp::socket socket_;
    std::vector<std::uint8_t> pending_;
    std::size_t pending_pos_ = 0;
};

Result<HttpRequest> read_request_head(SocketStream& stream);
Result<HttpResponse> read_response_head(SocketStream& stream);

/// Exactly @p length bytes of @p raw, then end of stream.
class ContentLengthBody : public InputStream {
public:
    ContentLengthBody(std::shared_ptr<InputStream> raw, std::uint64_t length)
        : raw_(std::move(raw)), remaining_(length) {}

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;

private:
    std::shared_ptr<InputStream> raw_;
    std::uint64_t remaining_;
};

/// Decodes "Transfer-Encoding: chunked"; trailers are read and dropped.
class ChunkedBody : public InputStream {
public:
    explicit ChunkedBody(std::shared_ptr<InputStream> raw) : raw_(std::move(raw)) {}

    Result<std::size_t> read(std::uint8_t* buffer, std::size_t len) override;

private:
    Result<std::string> read_line();
    Result<void> next_chunk();

    std::shared_ptr<InputStream> raw_;
    std::uint64_t chunk_left_ = 0;
    bool need_crlf_ = false;
    bool done_ = false;
};

/**
 * @brief Writes "Transfer-Encoding: chunked" framing onto @p out
 *
 * finish() writes the terminating zero-length chunk; a body that is never
 * finished is seen as truncated by the peer.
 */
class ChunkedSink : public OutputSink {
public:
    explicit ChunkedSink(OutputSink& out) : out_(out) {}

    Result<void> write(const std::uint8_t* data, std::size_t len) override;
    Result<void> finish();

private:
    OutputSink& out_;
};

/**
 * @brief Body stream for a message with @p headers
 *
 * Chunked when Transfer-Encoding says so, else Content-Length delimited.
 * Without either, a request has no body and a response runs to connection
 * close (@p until_close).
 */
Result<std::shared_ptr<InputStream>> open_body(const std::shared_ptr<SocketStream>& stream,
                                               const HttpHeaders& headers, bool until_close);

/// Parses a non-negative decimal header value.
Result<std::uint64_t> parse_length(const std::string& value);

} // namespace network
} // namespace flowfile

#pragma once

#include "flowfile/core/io.hpp"
#include "flowfile/core/result.hpp"
#include "flowfile/network/body_stream.hpp"
#include "flowfile/network/http_types.hpp"

#include <memory>
#include <string>

namespace flowfile {
namespace network {

/// Parsed "http://host[:port]/target" URL.
struct Url {
    std::string scheme = "http";
    std::string host;
    std::string port = "80";
    std::string target = "/";

    static Result<Url> parse(const std::string& text);

    /// Resolve a Location header against this URL.
    Result<Url> resolve(const std::string& location) const;

    /// Value for the Host header.
    std::string authority() const;
    std::string str() const;
};

struct HeadResult {
    Url url;  // after redirects
    HttpResponse response;
};

/**
 * @brief Minimal blocking HTTP/1.1 client over Boost.Asio
 *
 * Every request uses its own connection ("Connection: close"). Only plain
 * http:// URLs are supported.
 */
class HttpClient {
public:
    static constexpr std::size_t kMaxResponseBody = 64 * 1024;

    explicit HttpClient(std::string user_agent = "flowfile-cpp/1.0", int max_redirects = 5)
        : user_agent_(std::move(user_agent)), max_redirects_(max_redirects) {}

    /// HEAD @p url, following 301/302/303/307/308 up to max_redirects.
    Result<HeadResult> head(const Url& url, const HttpHeaders& headers) const;

    /**
     * @brief POST the bytes of @p body with chunked transfer encoding
     *
     * @p body is read until it reports end of stream, then the terminating
     * chunk is sent and the response is read. If @p body fails instead, the
     * connection is dropped without the terminating chunk, so the peer sees
     * a truncated request, and that error is returned.
     */
    Result<HttpResponse> post_chunked(const Url& url, const HttpHeaders& headers, InputStream& body) const;

private:
    Result<std::shared_ptr<SocketStream>> connect(const Url& url) const;
    Result<HttpResponse> read_response(const std::shared_ptr<SocketStream>& stream, bool has_body) const;
    HttpRequest make_request(HttpMethod method, const Url& url, const HttpHeaders& headers) const;

    std::string user_agent_;
    int max_redirects_;
};

} // namespace network
} // namespace flowfile

#include "flowfile/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace flowfile {
namespace network {
namespace asio = boost::asio;

// ──────────────────────────────────────────────────────────
// Url
// ──────────────────────────────────────────────────────────

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(ErrorCode::Configuration, "Invalid URL \"" + text + "\"");
    }
    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http") {
        return Err<Url>(ErrorCode::Configuration, "Unsupported URL scheme \"" + url.scheme + "\"");
    }

    const auto host_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", host_start);
    std::string authority = text.substr(host_start, path_start == std::string::npos ? std::string::npos
                                                                                     : path_start - host_start);
    if (path_start != std::string::npos) {
        url.target = text.substr(path_start);
        if (url.target[0] == '?') {
            url.target.insert(0, "/");
        }
    }
    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(ErrorCode::Configuration, "Invalid URL host in \"" + text + "\"");
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            url.port = authority.substr(close + 2);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
    }

    if (url.host.empty() || url.port.empty() ||
        !std::all_of(url.port.begin(), url.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return Err<Url>(ErrorCode::Configuration, "Invalid URL host or port in \"" + text + "\"");
    }
    return Ok(std::move(url));
}

Result<Url> Url::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }
    Url next = *this;
    if (!location.empty() && location[0] == '/') {
        next.target = location;
    } else {
        const auto path_end = target.find('?');
        const std::string path = target.substr(0, path_end);
        next.target = path.substr(0, path.rfind('/') + 1) + location;
    }
    return Ok(std::move(next));
}

std::string Url::authority() const {
    const std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return port == "80" ? h : h + ":" + port;
}

std::string Url::str() const {
    return scheme + "://" + authority() + target;
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

Result<std::shared_ptr<SocketStream>> HttpClient::connect(const Url& url) const {
    auto io_context = std::make_shared<asio::io_context>();
    boost::system::error_code ec;
    tcp::resolver resolver(*io_context);
    const auto endpoints = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        return Err<std::shared_ptr<SocketStream>>(ErrorCode::Transport,
            "Unable to resolve " + url.host + ": " + ec.message());
    }
    tcp::socket socket(*io_context);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<std::shared_ptr<SocketStream>>(ErrorCode::Transport,
            "Unable to connect to " + url.authority() + ": " + ec.message());
    }
    socket.set_option(tcp::no_delay(true), ec);
    return Ok(std::make_shared<SocketStream>(std::move(socket), std::move(io_context)));
}

HttpRequest HttpClient::make_request(HttpMethod method, const Url& url, const HttpHeaders& headers) const {
    HttpRequest request;
    request.method = method;
    request.url = url.target;
    request.headers.set("Host", url.authority());
    request.headers.set("User-Agent", user_agent_);
    for (const auto& [name, value] : headers) {
        request.headers.set(name, value);
    }
    request.headers.set("Connection", "close");
    return request;
}

Result<HttpResponse> HttpClient::read_response(const std::shared_ptr<SocketStream>& stream, bool has_body) const {
    auto head = read_response_head(*stream);
    if (head.is_error()) {
        return head;
    }
    HttpResponse response = std::move(head.value());
    if (!has_body) {
        return Ok(std::move(response));
    }

    auto body = open_body(stream, response.headers, true);
    if (body.is_error()) {
        return Err<HttpResponse>(body.error());
    }
    std::array<std::uint8_t, 8192> buffer{};
    for (;;) {
        auto got = body.value()->read(buffer.data(), buffer.size());
        if (got.is_error()) {
            return Err<HttpResponse>(got.error());
        }
        if (got.value() == 0) {
            break;
        }
        const auto keep = std::min(got.value(), kMaxResponseBody - std::min(kMaxResponseBody, response.body.size()));
        response.body.insert(response.body.end(), buffer.begin(), buffer.begin() + keep);
    }
    return Ok(std::move(response));
}

Result<HeadResult> HttpClient::head(const Url& url, const HttpHeaders& headers) const {
    Url current = url;
    for (int hop = 0;; ++hop) {
        auto stream = connect(current);
        if (stream.is_error()) {
            return Err<HeadResult>(stream.error());
        }
        const std::string head = make_request(HttpMethod::HEAD, current, headers).serialize_head();
        if (auto sent = stream.value()->write(reinterpret_cast<const std::uint8_t*>(head.data()), head.size());
            sent.is_error()) {
            return Err<HeadResult>(sent.error());
        }
        auto response = read_response(stream.value(), false);
        stream.value()->shutdown();
        if (response.is_error()) {
            return Err<HeadResult>(response.error());
        }

        const int status = response.value().status_code;
        if (!is_redirect(status)) {
            return Ok(HeadResult{current, std::move(response.value())});
        }
        if (hop >= max_redirects_) {
            return Err<HeadResult>(ErrorCode::Configuration,
                "Stopped after " + std::to_string(max_redirects_) + " redirects");
        }
        const std::string location = response.value().get_header("Location");
        if (location.empty()) {
            return Err<HeadResult>(ErrorCode::Configuration,
                "Redirect " + std::to_string(status) + " without a Location header");
        }
        auto next = current.resolve(location);
        if (next.is_error()) {
            return Err<HeadResult>(next.error());
        }
        spdlog::debug("HEAD {} redirected ({}) to {}", current.str(), status, next.value().str());
        current = std::move(next.value());
    }
}

Result<HttpResponse> HttpClient::post_chunked(const Url& url, const HttpHeaders& headers, InputStream& body) const {
    auto connected = connect(url);
    if (connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }
    auto stream = connected.value();

    HttpRequest request = make_request(HttpMethod::POST, url, headers);
    request.headers.set("Transfer-Encoding", "chunked");
    const std::string head = request.serialize_head();
    if (auto sent = stream->write(reinterpret_cast<const std::uint8_t*>(head.data()), head.size()); sent.is_error()) {
        return Err<HttpResponse>(sent.error());
    }

    ChunkedSink chunked(*stream);
    std::array<std::uint8_t, 32 * 1024> buffer{};
    for (;;) {
        auto got = body.read(buffer.data(), buffer.size());
        if (got.is_error()) {
            // Drop the connection without the terminating chunk.
            stream->shutdown();
            return Err<HttpResponse>(got.error());
        }
        if (got.value() == 0) {
            break;
        }
        if (auto sent = chunked.write(buffer.data(), got.value()); sent.is_error()) {
            stream->shutdown();
            return Err<HttpResponse>(sent.error());
        }
    }
    if (auto finished = chunked.finish(); finished.is_error()) {
        stream->shutdown();
        return Err<HttpResponse>(finished.error());
    }

    auto response = read_response(stream, true);
    stream->shutdown();
    return response;
}

} // namespace network
} // namespace flowfile

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <strings.h>

namespace flowfile {
namespace network {

/// Media type of a FlowFile v3 stream.
inline constexpr const char* kFlowFileContentType = "application/flowfile-v3";
inline constexpr const char* kProtocolVersion = "3";

// Header names of the transfer protocol.
inline constexpr const char* kHeaderTransactionId = "x-nifi-transaction-id";
inline constexpr const char* kHeaderProtocolVersion = "x-nifi-transfer-protocol-version";
inline constexpr const char* kHeaderMaxPartitionSize = "Max-Partition-Size";

/**
 * @brief HTTP request methods the protocol uses
 *
 * Anything else is parsed as UNKNOWN and answered with 405.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid the Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    MOVED_PERMANENTLY = 301,
    FOUND = 302,
    SEE_OTHER = 303,
    TEMPORARY_REDIRECT = 307,
    PERMANENT_REDIRECT = 308,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    LENGTH_REQUIRED = 411,
    INTERNAL_SERVER_ERROR = 500,
    NOT_IMPLEMENTED = 501,
    SERVICE_UNAVAILABLE = 503
};

inline bool is_redirect(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

/**
 * @brief Ordered header list with case-insensitive lookup
 *
 * Header names are case-insensitive per RFC 7230; the spelling of the first
 * set() is kept for output.
 */
class HttpHeaders {
public:
    using const_iterator = std::vector<std::pair<std::string, std::string>>::const_iterator;

    /// Value of @p name, or "" when absent.
    std::string get(const std::string& name) const {
        for (const auto& [key, value] : entries_) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has(const std::string& name) const {
        for (const auto& entry : entries_) {
            if (strcasecmp(entry.first.c_str(), name.c_str()) == 0) {
                return true;
            }
        }
        return false;
    }

    void set(const std::string& name, const std::string& value) {
        for (auto& entry : entries_) {
            if (strcasecmp(entry.first.c_str(), name.c_str()) == 0) {
                entry.second = value;
                return;
            }
        }
        entries_.emplace_back(name, value);
    }

    std::size_t size() const noexcept { return entries_.size(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

/**
 * @brief Request line and headers of an HTTP/1.x request
 *
 * Bodies are streamed separately (see body_stream.hpp), so only the head is
 * held in memory.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string method_name;
    std::string url;  // request target, e.g. "/contentListener"
    HttpVersion version = HttpVersion::HTTP_1_1;
    HttpHeaders headers;

    std::string get_header(const std::string& name) const { return headers.get(name); }
    bool has_header(const std::string& name) const { return headers.has(name); }

    /// Request line and headers terminated by the empty line.
    std::string serialize_head() const;
};

/**
 * @brief An HTTP response
 *
 * Responses produced by the receiver are small, so the body is held in full.
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    HttpHeaders headers;
    std::vector<std::uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /// Sets the body and its Content-Length.
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers.set("Content-Length", std::to_string(body.size()));
    }

    void set_header(const std::string& name, const std::string& value) {
        headers.set(name, value);
    }

    std::string get_header(const std::string& name) const { return headers.get(name); }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /// Status line, headers and body in wire format.
    std::vector<std::uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "\r\n";

        const std::string head = oss.str();
        std::vector<std::uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::MOVED_PERMANENTLY: return "Moved Permanently";
            case HttpStatus::FOUND: return "Found";
            case HttpStatus::SEE_OTHER: return "See Other";
            case HttpStatus::TEMPORARY_REDIRECT: return "Temporary Redirect";
            case HttpStatus::PERMANENT_REDIRECT: return "Permanent Redirect";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::LENGTH_REQUIRED: return "Length Required";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::NOT_IMPLEMENTED: return "Not Implemented";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

inline std::string HttpRequest::serialize_head() const {
    std::ostringstream oss;
    oss << (method == HttpMethod::UNKNOWN ? method_name : HttpMethodUtils::to_string(method)) << " "
        << url << " "
        << HttpResponse::version_to_string(version) << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

} // namespace network
} // namespace flowfile

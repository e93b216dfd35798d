#pragma once

#include "flowfile/core/result.hpp"
#include "flowfile/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace flowfile {
namespace network {

/**
 * @brief State machine states for parsing an HTTP message head
 *
 * Request:  METHOD SP URL SP VERSION CRLF
 * Response: VERSION SP STATUS SP REASON CRLF
 * followed by (Header-Name: Header-Value CRLF)* CRLF
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    STATUS_VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental parser for the head of an HTTP/1.x message
 *
 * Data may arrive in arbitrary pieces. Parsing stops at the empty line that
 * ends the headers; @p consumed tells the caller where the body starts within
 * the last buffer, so the body can be streamed rather than buffered.
 *
 * Usage:
 * @code
 *   HttpParser parser(HttpParser::Mode::Request);
 *   auto done = parser.parse(buf, n, consumed);
 *   if (done.is_ok() && done.value()) { auto req = parser.request(); }
 * @endcode
 */
class HttpParser {
public:
    enum class Mode { Request, Response };

    /// Heads larger than this are rejected.
    static constexpr std::size_t kMaxHeadSize = 64 * 1024;

    explicit HttpParser(Mode mode = Mode::Request);

    /**
     * @brief Feed @p len bytes
     *
     * @return true once the head is complete, false when more data is needed,
     *         Malformed on a protocol violation
     */
    Result<bool> parse(const char* data, std::size_t len, std::size_t& consumed);

    const HttpRequest& request() const { return request_; }
    const HttpResponse& response() const { return response_; }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    void reset();

private:
    bool parse_method(char c);
    bool parse_url(char c);
    bool parse_version(char c);
    bool parse_status_version(char c);
    bool parse_status_code(char c);
    bool parse_reason(char c);
    bool parse_header_name(char c);
    bool parse_header_value(char c);

    Mode mode_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    HttpResponse response_;
    std::string buffer_;               // current token
    std::string current_header_name_;
    std::size_t line_ = 1;             // for error reporting
    std::size_t head_size_ = 0;
    bool last_char_was_cr_ = false;
};

} // namespace network
} // namespace flowfile

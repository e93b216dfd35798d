#include "flowfile/network/http_parser.hpp"

#include <cctype>
#include <cstring>

namespace flowfile {
namespace network {
namespace {

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool to_version(const std::string& text, HttpVersion& out) {
    if (text == "HTTP/1.1") {
        out = HttpVersion::HTTP_1_1;
        return true;
    }
    if (text == "HTTP/1.0") {
        out = HttpVersion::HTTP_1_0;
        return true;
    }
    return false;
}

void trim_trailing(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
}

} // namespace

HttpParser::HttpParser(Mode mode)
    : mode_(mode) {
    reset();
}

void HttpParser::reset() {
    state_ = mode_ == Mode::Request ? ParseState::METHOD : ParseState::STATUS_VERSION;
    request_ = HttpRequest();
    response_ = HttpResponse();
    buffer_.clear();
    current_header_name_.clear();
    line_ = 1;
    head_size_ = 0;
    last_char_was_cr_ = false;
}

Result<bool> HttpParser::parse(const char* data, std::size_t len, std::size_t& consumed) {
    consumed = 0;
    if (state_ == ParseState::COMPLETE) {
        return Ok(true);
    }
    if (state_ == ParseState::PARSE_ERROR) {
        return Err<bool>(ErrorCode::Malformed, "Parser in error state");
    }

    for (std::size_t i = 0; i < len; ++i) {
        const char c = data[i];
        ++consumed;
        if (++head_size_ > kMaxHeadSize) {
            state_ = ParseState::PARSE_ERROR;
            return Err<bool>(ErrorCode::Malformed, "HTTP head exceeds " + std::to_string(kMaxHeadSize) + " bytes");
        }
        if (c == '\n') {
            ++line_;
        }

        bool ok = true;
        const char* what = "";
        switch (state_) {
            case ParseState::METHOD: ok = parse_method(c); what = "HTTP method"; break;
            case ParseState::URL: ok = parse_url(c); what = "URL"; break;
            case ParseState::VERSION: ok = parse_version(c); what = "HTTP version"; break;
            case ParseState::STATUS_VERSION: ok = parse_status_version(c); what = "HTTP version"; break;
            case ParseState::STATUS_CODE: ok = parse_status_code(c); what = "status code"; break;
            case ParseState::REASON: ok = parse_reason(c); what = "reason phrase"; break;
            case ParseState::HEADER_NAME: ok = parse_header_name(c); what = "header name"; break;
            case ParseState::HEADER_VALUE: ok = parse_header_value(c); what = "header value"; break;
            case ParseState::COMPLETE:
            case ParseState::PARSE_ERROR:
                break;
        }
        if (!ok) {
            state_ = ParseState::PARSE_ERROR;
            return Err<bool>(ErrorCode::Malformed,
                std::string("Failed to parse ") + what + " at line " + std::to_string(line_));
        }
        if (state_ == ParseState::COMPLETE) {
            return Ok(true);
        }
    }
    return Ok(false);
}

bool HttpParser::parse_method(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.method_name = buffer_;
        request_.method = HttpMethodUtils::from_string(buffer_);
        buffer_.clear();
        state_ = ParseState::URL;
        return true;
    }
    if (!std::isupper(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_url(char c) {
    if (c == ' ') {
        if (buffer_.empty()) {
            return false;
        }
        request_.url = buffer_;
        buffer_.clear();
        state_ = ParseState::VERSION;
        return true;
    }
    if (!std::isprint(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_version(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        if (!to_version(buffer_, request_.version)) {
            return false;
        }
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::parse_status_version(char c) {
    if (c == ' ') {
        if (!to_version(buffer_, response_.version)) {
            return false;
        }
        buffer_.clear();
        state_ = ParseState::STATUS_CODE;
        return true;
    }
    buffer_ += c;
    return buffer_.size() <= 8;
}

bool HttpParser::parse_status_code(char c) {
    if (c == ' ' || c == '\r') {
        if (buffer_.size() != 3) {
            return false;
        }
        response_.status_code = std::stoi(buffer_);
        buffer_.clear();
        state_ = ParseState::REASON;
        last_char_was_cr_ = c == '\r';
        return true;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_reason(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        response_.reason_phrase = buffer_;
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpParser::parse_header_name(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return buffer_.empty();
    }
    if (c == '\n' && last_char_was_cr_) {
        // Empty line: the head is complete, whatever follows is body.
        last_char_was_cr_ = false;
        state_ = ParseState::COMPLETE;
        return true;
    }
    last_char_was_cr_ = false;

    if (c == ':') {
        if (buffer_.empty()) {
            return false;
        }
        current_header_name_ = buffer_;
        buffer_.clear();
        state_ = ParseState::HEADER_VALUE;
        return true;
    }
    if (!is_token_char(c)) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpParser::parse_header_value(char c) {
    if (buffer_.empty() && (c == ' ' || c == '\t')) {
        return true;
    }
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        trim_trailing(buffer_);
        if (mode_ == Mode::Request) {
            request_.headers.set(current_header_name_, buffer_);
        } else {
            response_.headers.set(current_header_name_, buffer_);
        }
        buffer_.clear();
        current_header_name_.clear();
        last_char_was_cr_ = false;
        state_ = ParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

} // namespace network
} // namespace flowfile

// src/core/http.hpp
// Transport-agnostic request serialization and response head parsing
//
// This module provides the text protocol pieces that sit on top of any byte
// stream (plain TCP or TLS):
//   - Header validation (CRLF injection)
//   - Request message with write_to(sink) serialization, written piecewise
//     straight into the sink without building an intermediate string
//   - Incremental status-line and header-block parser that reports how many
//     bytes it consumed and never needs to see a byte twice
//
// Status line grammar:   token SP 3DIGIT [SP reason] CRLF
// Header line grammar:   name ":" OWS value OWS CRLF
// End of head:           empty line (CRLF)
//
// The protocol token is not restricted to "HTTP/1.x", so both
// "HTTP/1.1 200 OK" and "STATUS 200 OK" are accepted.

#pragma once

#include "error.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sockclient {
namespace http {

using HeaderMap = std::vector<std::pair<std::string, std::string>>;

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Utilities
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Validate header key/value for CRLF injection attacks
 *
 * @param key Header name
 * @param value Header value
 * @return true if safe, false if contains CR/LF, ':' in the name, or empty name
 */
inline bool is_valid_header(std::string_view key, std::string_view value) {
    if (key.empty()) {
        return false;
    }
    if (key.find_first_of("\r\n: \t") != std::string_view::npos) {
        return false;
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        return false;
    }
    return true;
}

// ASCII case-insensitive compare for header names
inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline const std::string* find_header(const HeaderMap& headers, std::string_view name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return &value;
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// Request
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Sink collecting serialized bytes into a string (tests, tracing)
 */
struct StringSink {
    std::string out;

    void write(const void* data, size_t len) {
        out.append(static_cast<const char*>(data), len);
    }
    void write(std::string_view s) {
        out.append(s);
    }
};

/**
 * Default request message
 *
 * Serialized as:
 *   METHOD SP target SP version CRLF
 *   (name: value CRLF)*
 *   [Content-Length: n CRLF]   when body is non-empty and not already set
 *   CRLF
 *   body
 *
 * Headers failing is_valid_header() are skipped.
 */
struct Request {
    std::string method = "GET";
    std::string target = "/";
    std::string version = "HTTP/1.1";
    HeaderMap headers;
    std::string body;

    Request() = default;
    Request(std::string m, std::string t)
        : method(std::move(m))
        , target(std::move(t))
    {}

    Request& add_header(std::string key, std::string value) {
        headers.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    Request& set_body(std::string b) {
        body = std::move(b);
        return *this;
    }

    /**
     * Serialize into a sink
     *
     * @param sink Any type with write(std::string_view)
     * @throws std::invalid_argument if method/target/version contain SP, CR or LF
     */
    template<typename Sink>
    void write_to(Sink& sink) const {
        if (!is_request_token(method) || !is_request_token(target) || !is_request_token(version)) {
            throw std::invalid_argument("Invalid request line");
        }

        sink.write(std::string_view(method));
        sink.write(std::string_view(" "));
        sink.write(std::string_view(target));
        sink.write(std::string_view(" "));
        sink.write(std::string_view(version));
        sink.write(std::string_view("\r\n"));

        for (const auto& [key, value] : headers) {
            if (!is_valid_header(key, value)) {
                continue;  // Skip invalid headers
            }
            sink.write(std::string_view(key));
            sink.write(std::string_view(": "));
            sink.write(std::string_view(value));
            sink.write(std::string_view("\r\n"));
        }

        if (!body.empty() && !find_header(headers, "Content-Length")) {
            char len_buf[24];   // any size_t fits
            char* end = std::to_chars(len_buf, len_buf + sizeof(len_buf), body.size()).ptr;
            sink.write(std::string_view("Content-Length: "));
            sink.write(std::string_view(len_buf, static_cast<size_t>(end - len_buf)));
            sink.write(std::string_view("\r\n"));
        }

        sink.write(std::string_view("\r\n"));

        if (!body.empty()) {
            sink.write(std::string_view(body));
        }
    }

private:
    static bool is_request_token(std::string_view s) {
        return !s.empty() && s.find_first_of(" \r\n") == std::string_view::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Response Head
// ═══════════════════════════════════════════════════════════════════════════

struct ResponseHead {
    std::string version;   // protocol token, e.g. "HTTP/1.1" or "STATUS"
    int status_code = 0;
    std::string reason;
    HeaderMap headers;

    const std::string* find_header(std::string_view name) const {
        return http::find_header(headers, name);
    }

    /**
     * Content-Length of the body, if present
     *
     * @param out Receives the length
     * @return false if the header is absent
     * @throws MalformedResponse if the value is not a decimal integer
     */
    bool content_length(uint64_t* out) const {
        const std::string* value = find_header("Content-Length");
        if (!value) return false;

        const char* first = value->data();
        const char* last = value->data() + value->size();
        uint64_t n = 0;
        auto [ptr, ec] = std::from_chars(first, last, n);
        if (ec != std::errc() || ptr != last || first == last) {
            throw MalformedResponse("Invalid Content-Length: " + *value);
        }
        *out = n;
        return true;
    }

    // 1xx, 204 and 304 responses never carry a body
    bool has_no_body() const {
        return (status_code >= 100 && status_code < 200) ||
               status_code == 204 || status_code == 304;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Incremental Response Parser
// ═══════════════════════════════════════════════════════════════════════════

enum class ParseStatus : uint8_t {
    Complete,
    NeedMoreData,
    Invalid,
};

struct ParseResult {
    ParseStatus status;
    size_t consumed;   // bytes absorbed, valid for every status except Invalid
};

/**
 * Parser for the response head
 *
 * One instance per exchange. parse_headers() appends every complete line it
 * sees and reports those bytes as consumed even when the block is not yet
 * finished, so the caller can release them and resume with the remainder.
 */
class ResponseParser {
public:
    static constexpr size_t MAX_LINE_LENGTH = 8192;
    static constexpr size_t MAX_HEADERS = 128;

    ParseResult parse_status_line(const uint8_t* data, size_t len, ResponseHead& head) {
        std::string_view line;
        size_t line_len = 0;
        ParseStatus st = next_line(data, len, &line, &line_len);
        if (st != ParseStatus::Complete) return {st, 0};

        // token
        size_t sp1 = line.find(' ');
        if (sp1 == std::string_view::npos || sp1 == 0) return invalid();
        std::string_view token = line.substr(0, sp1);
        for (char c : token) {
            if (!is_token_char(c)) return invalid();
        }

        // 3DIGIT
        std::string_view rest = line.substr(sp1 + 1);
        if (rest.size() < 3) return invalid();
        int code = 0;
        for (size_t i = 0; i < 3; i++) {
            if (rest[i] < '0' || rest[i] > '9') return invalid();
            code = code * 10 + (rest[i] - '0');
        }

        // [SP reason]
        std::string_view reason;
        if (rest.size() > 3) {
            if (rest[3] != ' ') return invalid();
            reason = rest.substr(4);
        }

        head.version.assign(token);
        head.status_code = code;
        head.reason.assign(reason);
        status_line_done_ = true;
        return {ParseStatus::Complete, line_len};
    }

    ParseResult parse_headers(const uint8_t* data, size_t len, HeaderMap& headers) {
        size_t pos = 0;
        for (;;) {
            std::string_view line;
            size_t line_len = 0;
            ParseStatus st = next_line(data + pos, len - pos, &line, &line_len);
            if (st == ParseStatus::Invalid) return invalid();
            if (st == ParseStatus::NeedMoreData) return {ParseStatus::NeedMoreData, pos};

            pos += line_len;
            if (line.empty()) {
                headers_done_ = true;
                return {ParseStatus::Complete, pos};
            }

            // obs-fold (continuation line) is rejected
            if (line[0] == ' ' || line[0] == '\t') return invalid();

            size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) return invalid();
            std::string_view name = line.substr(0, colon);
            for (char c : name) {
                if (!is_token_char(c)) return invalid();
            }

            std::string_view value = trim(line.substr(colon + 1));
            if (++header_count_ > MAX_HEADERS) return invalid();
            headers.emplace_back(std::string(name), std::string(value));
        }
    }

    bool status_line_done() const { return status_line_done_; }
    bool headers_done() const { return headers_done_; }

private:
    static ParseResult invalid() { return {ParseStatus::Invalid, 0}; }

    // Locate one CRLF-terminated line; bare LF is a syntax error
    static ParseStatus next_line(const uint8_t* data, size_t len,
                                 std::string_view* line, size_t* line_len) {
        const void* lf = std::memchr(data, '\n', len);
        if (!lf) {
            return len > MAX_LINE_LENGTH ? ParseStatus::Invalid : ParseStatus::NeedMoreData;
        }
        size_t lf_pos = static_cast<size_t>(static_cast<const uint8_t*>(lf) - data);
        if (lf_pos == 0 || data[lf_pos - 1] != '\r') {
            return ParseStatus::Invalid;
        }
        if (lf_pos > MAX_LINE_LENGTH) {
            return ParseStatus::Invalid;
        }
        *line = std::string_view(reinterpret_cast<const char*>(data), lf_pos - 1);
        if (line->find('\r') != std::string_view::npos) {
            return ParseStatus::Invalid;
        }
        *line_len = lf_pos + 1;
        return ParseStatus::Complete;
    }

    static bool is_token_char(char c) {
        unsigned char u = static_cast<unsigned char>(c);
        return u > 0x20 && u < 0x7f && c != ':';
    }

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
        return s;
    }

    bool status_line_done_ = false;
    bool headers_done_ = false;
    size_t header_count_ = 0;
};

} // namespace http
} // namespace sockclient

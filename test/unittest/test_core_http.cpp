// test/unittest/test_core_http.cpp
// Unit tests for request serialization and the response head parser

#include "../../src/core/http.hpp"
#include "test_common.hpp"

#include <cstring>
#include <string>

using namespace sockclient;
using namespace sockclient::http;

static const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

// ============================================================================
// Header validation
// ============================================================================

TEST(valid_header) {
    ASSERT_TRUE(is_valid_header("Content-Type", "application/json"));
    ASSERT_TRUE(is_valid_header("X-Empty", ""));
}

TEST(header_injection_rejected) {
    ASSERT_FALSE(is_valid_header("X-Evil\r\nInjected", "v"));
    ASSERT_FALSE(is_valid_header("X-Evil", "v\r\nInjected: yes"));
    ASSERT_FALSE(is_valid_header("X-Evil", "line\nbreak"));
    ASSERT_FALSE(is_valid_header("Bad:Name", "v"));
    ASSERT_FALSE(is_valid_header("Bad Name", "v"));
    ASSERT_FALSE(is_valid_header("", "v"));
}

TEST(case_insensitive_lookup) {
    HeaderMap headers = {{"Content-Length", "5"}, {"X-Trace", "abc"}};
    const std::string* v = find_header(headers, "content-length");
    ASSERT_TRUE(v != nullptr);
    ASSERT_EQ(*v, std::string("5"));
    ASSERT_TRUE(find_header(headers, "missing") == nullptr);
}

// ============================================================================
// Request serialization
// ============================================================================

TEST(request_without_body) {
    Request req("GET", "/status");
    req.add_header("Host", "example.com");

    StringSink sink;
    req.write_to(sink);
    ASSERT_EQ(sink.out, std::string("GET /status HTTP/1.1\r\nHost: example.com\r\n\r\n"));
}

TEST(request_body_adds_content_length) {
    Request req("POST", "/submit");
    req.set_body("hello");

    StringSink sink;
    req.write_to(sink);
    ASSERT_EQ(sink.out, std::string("POST /submit HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello"));
}

TEST(request_large_body_content_length_digits) {
    Request req("POST", "/bulk");
    req.set_body(std::string(123456, 'z'));

    StringSink sink;
    req.write_to(sink);
    std::string head = "POST /bulk HTTP/1.1\r\nContent-Length: 123456\r\n\r\n";
    ASSERT_EQ(sink.out.size(), head.size() + 123456u);
    ASSERT_EQ(sink.out.substr(0, head.size()), head);
}

TEST(request_explicit_content_length_kept) {
    Request req("PUT", "/x");
    req.add_header("content-length", "3").set_body("abc");

    StringSink sink;
    req.write_to(sink);
    ASSERT_EQ(sink.out, std::string("PUT /x HTTP/1.1\r\ncontent-length: 3\r\n\r\nabc"));
}

TEST(request_invalid_headers_skipped) {
    Request req;
    req.add_header("X-Good", "1").add_header("X-Bad", "a\r\nX-Injected: 1");

    StringSink sink;
    req.write_to(sink);
    ASSERT_EQ(sink.out, std::string("GET / HTTP/1.1\r\nX-Good: 1\r\n\r\n"));
}

TEST(request_invalid_line_rejected) {
    Request req("GET", "/a b");
    StringSink sink;
    ASSERT_THROWS(req.write_to(sink), std::invalid_argument);

    Request empty_method("", "/");
    ASSERT_THROWS(empty_method.write_to(sink), std::invalid_argument);
}

// ============================================================================
// Status line
// ============================================================================

TEST(status_line_custom_token) {
    ResponseParser parser;
    ResponseHead head;
    std::string in = "STATUS 200 OK\r\n";
    ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(r.consumed, in.size());
    ASSERT_EQ(head.version, std::string("STATUS"));
    ASSERT_EQ(head.status_code, 200);
    ASSERT_EQ(head.reason, std::string("OK"));
    ASSERT_TRUE(parser.status_line_done());
}

TEST(status_line_reason_with_spaces) {
    ResponseParser parser;
    ResponseHead head;
    std::string in = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n";
    ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(r.consumed, strlen("HTTP/1.1 404 Not Found\r\n"));
    ASSERT_EQ(head.status_code, 404);
    ASSERT_EQ(head.reason, std::string("Not Found"));
}

TEST(status_line_without_reason) {
    ResponseParser parser;
    ResponseHead head;
    std::string in = "HTTP/1.1 204\r\n";
    ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(head.status_code, 204);
    ASSERT_TRUE(head.reason.empty());
    ASSERT_TRUE(head.has_no_body());
}

TEST(status_line_needs_more_data) {
    ResponseParser parser;
    ResponseHead head;
    std::string in = "STATUS 20";
    ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::NeedMoreData);
    ASSERT_EQ(r.consumed, 0u);

    in = "STATUS 200 OK\r";   // CR without LF yet
    r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::NeedMoreData);
    ASSERT_FALSE(parser.status_line_done());
}

TEST(status_line_invalid) {
    const char* cases[] = {
        "STATUS20 OK\r\n",        // no space
        " 200 OK\r\n",            // empty token
        "STATUS 2x0 OK\r\n",      // non-digit code
        "STATUS 20\r\n",          // short code
        "STATUS 2000 OK\r\n",     // four digits
        "STATUS 200 OK\n",        // bare LF
        "STATUS 200 O\rK\r\n",    // stray CR
    };
    for (const char* c : cases) {
        ResponseParser parser;
        ResponseHead head;
        std::string in = c;
        ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
        if (r.status != ParseStatus::Invalid) {
            TEST_FAIL_("Expected invalid status line: " << c);
        }
    }
}

TEST(status_line_too_long) {
    ResponseParser parser;
    ResponseHead head;
    std::string in = "STATUS 200 " + std::string(ResponseParser::MAX_LINE_LENGTH + 16, 'x');
    ParseResult r = parser.parse_status_line(bytes(in), in.size(), head);
    ASSERT_TRUE(r.status == ParseStatus::Invalid);
}

// ============================================================================
// Header block
// ============================================================================

TEST(headers_complete) {
    ResponseParser parser;
    HeaderMap headers;
    std::string in = "Content-Length: 5\r\nX-Id:  42 \r\n\r\nhello";
    ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(r.consumed, in.size() - 5);
    ASSERT_EQ(headers.size(), 2u);
    ASSERT_EQ(headers[0].first, std::string("Content-Length"));
    ASSERT_EQ(headers[0].second, std::string("5"));
    ASSERT_EQ(headers[1].second, std::string("42"));
    ASSERT_TRUE(parser.headers_done());
}

TEST(headers_partial_reports_absorbed_lines) {
    ResponseParser parser;
    HeaderMap headers;
    std::string in = "A: 1\r\nB: 2\r\nC:";
    ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::NeedMoreData);
    ASSERT_EQ(r.consumed, strlen("A: 1\r\nB: 2\r\n"));
    ASSERT_EQ(headers.size(), 2u);

    // Resume with the remainder only; earlier lines are never seen again
    std::string rest = "C: 3\r\n\r\n";
    r = parser.parse_headers(bytes(rest), rest.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(r.consumed, rest.size());
    ASSERT_EQ(headers.size(), 3u);
    ASSERT_EQ(headers[2].first, std::string("C"));
}

TEST(headers_empty_block) {
    ResponseParser parser;
    HeaderMap headers;
    std::string in = "\r\n";
    ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::Complete);
    ASSERT_EQ(r.consumed, 2u);
    ASSERT_TRUE(headers.empty());
}

TEST(headers_obs_fold_rejected) {
    ResponseParser parser;
    HeaderMap headers;
    std::string in = "X-Long: a\r\n  continued\r\n\r\n";
    ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::Invalid);
}

TEST(headers_invalid_lines) {
    const char* cases[] = {
        "NoColon\r\n\r\n",
        ": empty-name\r\n\r\n",
        "Bad Name: v\r\n\r\n",
        "X: v\n\r\n",
    };
    for (const char* c : cases) {
        ResponseParser parser;
        HeaderMap headers;
        std::string in = c;
        ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
        if (r.status != ParseStatus::Invalid) {
            TEST_FAIL_("Expected invalid header block: " << c);
        }
    }
}

TEST(headers_limit_enforced) {
    ResponseParser parser;
    HeaderMap headers;
    std::string in;
    for (size_t i = 0; i <= ResponseParser::MAX_HEADERS; i++) {
        in += "H" + std::to_string(i) + ": v\r\n";
    }
    in += "\r\n";
    ParseResult r = parser.parse_headers(bytes(in), in.size(), headers);
    ASSERT_TRUE(r.status == ParseStatus::Invalid);
}

// ============================================================================
// Response head helpers
// ============================================================================

TEST(content_length_parsing) {
    ResponseHead head;
    uint64_t len = 99;
    ASSERT_FALSE(head.content_length(&len));

    head.headers.emplace_back("content-length", "1234");
    ASSERT_TRUE(head.content_length(&len));
    ASSERT_EQ(len, 1234u);

    ResponseHead bad;
    bad.headers.emplace_back("Content-Length", "12abc");
    ASSERT_THROWS(bad.content_length(&len), MalformedResponse);

    ResponseHead negative;
    negative.headers.emplace_back("Content-Length", "-1");
    ASSERT_THROWS(negative.content_length(&len), MalformedResponse);
}

TEST(bodyless_status_codes) {
    ResponseHead head;
    for (int code : {100, 101, 204, 304}) {
        head.status_code = code;
        ASSERT_TRUE(head.has_no_body());
    }
    for (int code : {200, 201, 404, 500}) {
        head.status_code = code;
        ASSERT_FALSE(head.has_no_body());
    }
}

// ============================================================================
// Main
// ============================================================================

int main() {
    return run_all_tests("Core HTTP");
}

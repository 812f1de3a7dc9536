// test/unittest/test_response_assembler.cpp
// Unit tests for ResponseAssembler and ResponseBody over a ByteChannel
//
// A writer thread plays the Receiver: it feeds the response in arbitrary
// fragments with small pauses, so the assembler sees partial lines.

#include "../../src/core/byte_channel.hpp"
#include "../../src/core/error.hpp"
#include "../../src/pipeline/exchange.hpp"
#include "../../src/pipeline/response_assembler.hpp"
#include "test_common.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace sockclient;
using namespace sockclient::pipeline;

using Assembler = ResponseAssembler<>;

static const std::string kResponse = "STATUS 200 OK\r\nContent-Length: 5\r\n\r\nhello";

// Split s into k pieces of roughly equal size
static std::vector<std::string> split_into(const std::string& s, size_t k) {
    std::vector<std::string> parts;
    size_t step = (s.size() + k - 1) / k;
    for (size_t off = 0; off < s.size(); off += step) {
        parts.push_back(s.substr(off, step));
    }
    return parts;
}

template<typename Channel>
static std::thread feed(Channel& ch, std::vector<std::string> parts, bool complete_after,
                        int delay_ms = 2) {
    return std::thread([&ch, parts = std::move(parts), complete_after, delay_ms]() {
        for (const auto& p : parts) {
            ch.write(p.data(), p.size());
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        if (complete_after) ch.complete();
    });
}

// ============================================================================
// Head assembly
// ============================================================================

TEST(head_in_single_chunk) {
    ByteChannel<4096> ch;
    ch.init();
    ch.write(kResponse.data(), kResponse.size());

    http::ResponseHead head = Assembler::parse(ch);
    ASSERT_EQ(head.version, std::string("STATUS"));
    ASSERT_EQ(head.status_code, 200);
    ASSERT_EQ(head.reason, std::string("OK"));
    ASSERT_EQ(head.headers.size(), 1u);

    // Exactly the body remains
    ASSERT_EQ(ch.readable(), 5u);
}

TEST(head_split_across_chunks) {
    for (size_t k = 1; k <= 10; k++) {
        ByteChannel<4096> ch;
        ch.init();
        std::thread writer = feed(ch, split_into(kResponse, k), false);

        http::ResponseHead head = Assembler::parse(ch);
        writer.join();

        ASSERT_EQ(head.version, std::string("STATUS"));
        ASSERT_EQ(head.status_code, 200);
        ASSERT_EQ(head.reason, std::string("OK"));
        const std::string* cl = head.find_header("Content-Length");
        ASSERT_TRUE(cl != nullptr);
        ASSERT_EQ(*cl, std::string("5"));
        ASSERT_EQ(ch.readable(), 5u);
    }
}

TEST(head_split_byte_by_byte) {
    ByteChannel<4096> ch;
    ch.init();
    std::thread writer = feed(ch, split_into(kResponse, kResponse.size()), false, 1);

    http::ResponseHead head = Assembler::parse(ch);
    writer.join();
    ASSERT_EQ(head.status_code, 200);
    ASSERT_EQ(head.headers.size(), 1u);
}

TEST(head_straddling_buffer_wrap) {
    ByteChannel<64> ch;
    ch.init();
    ASSERT_FALSE(ch.is_mirrored());

    // Move the write position close to the end of the buffer
    std::string filler(50, 'z');
    ch.write(filler.data(), filler.size());
    ReadResult r = ch.read();
    ch.advance(r.region.total());

    std::string resp = "STATUS 201 Created\r\nA: 1\r\n\r\n";
    std::thread writer = feed(ch, split_into(resp, 3), false);

    http::ResponseHead head = Assembler::parse(ch);
    writer.join();
    ASSERT_EQ(head.status_code, 201);
    ASSERT_EQ(head.reason, std::string("Created"));
    ASSERT_EQ(head.headers.size(), 1u);
    ASSERT_EQ(head.headers[0].second, std::string("1"));
    ASSERT_EQ(ch.readable(), 0u);
}

TEST(many_headers_larger_than_one_read) {
    ByteChannel<4096> ch;
    ch.init();

    std::string resp = "HTTP/1.1 200 OK\r\n";
    for (int i = 0; i < 40; i++) {
        resp += "X-Header-" + std::to_string(i) + ": value-" + std::to_string(i) + "\r\n";
    }
    resp += "\r\n";
    std::thread writer = feed(ch, split_into(resp, 7), false);

    http::ResponseHead head = Assembler::parse(ch);
    writer.join();
    ASSERT_EQ(head.headers.size(), 40u);
    ASSERT_EQ(head.headers[39].first, std::string("X-Header-39"));
    ASSERT_EQ(head.headers[39].second, std::string("value-39"));
}

// ============================================================================
// Errors
// ============================================================================

TEST(eos_before_status_line) {
    ByteChannel<4096> ch;
    ch.init();
    std::thread writer = feed(ch, {"STATUS 2"}, true);

    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
    writer.join();
}

TEST(eos_before_headers_end) {
    ByteChannel<4096> ch;
    ch.init();
    std::thread writer = feed(ch, {"STATUS 200 OK\r\n", "Content-Length: 5\r\n"}, true);

    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
    writer.join();
}

TEST(eos_on_empty_stream) {
    ByteChannel<4096> ch;
    ch.init();
    ch.complete();
    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
}

TEST(syntax_error_in_status_line) {
    ByteChannel<4096> ch;
    ch.init();
    std::string bad = "GARBAGE\r\n\r\n";
    ch.write(bad.data(), bad.size());
    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
}

TEST(syntax_error_in_header) {
    ByteChannel<4096> ch;
    ch.init();
    std::string bad = "STATUS 200 OK\r\nno colon here\r\n\r\n";
    ch.write(bad.data(), bad.size());
    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
}

TEST(invalid_content_length) {
    ByteChannel<4096> ch;
    ch.init();
    std::string bad = "STATUS 200 OK\r\nContent-Length: five\r\n\r\n";
    ch.write(bad.data(), bad.size());
    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
}

TEST(head_larger_than_buffer) {
    ByteChannel<64> ch;
    ch.init();
    std::string huge = "STATUS 200 " + std::string(60, 'x');
    std::thread writer([&]() {
        ch.write(huge.data(), 64);   // fills the buffer, no line end
    });

    ASSERT_THROWS(Assembler::parse(ch), MalformedResponse);
    ch.complete_reader();
    writer.join();
}

TEST(transport_error_propagates) {
    ByteChannel<4096> ch;
    ch.init();
    ch.write("STATUS 200", 10);
    ch.complete(std::make_exception_ptr(TransportError("Receive failed: reset")));
    ASSERT_THROWS(Assembler::parse(ch), TransportError);
}

// ============================================================================
// Body framing
// ============================================================================

TEST(body_with_content_length) {
    ByteChannel<4096> ch;
    ch.init();
    std::string resp = kResponse + "NEXT";   // trailing bytes belong to the next response
    std::thread writer = feed(ch, split_into(resp, 4), false);

    BodyState state;
    http::ResponseHead head = Assembler::parse(ch);
    state.reset_for(head);
    ResponseBody<ByteChannel<4096>> body(&ch, &state);

    ASSERT_TRUE(body.has_length());
    ASSERT_EQ(body.read_all(), std::string("hello"));
    ASSERT_TRUE(body.is_complete());
    writer.join();

    // Body reading never crosses into the following bytes
    ASSERT_EQ(ch.readable(), 4u);
    ASSERT_EQ(body.next_chunk().total(), 0u);
}

TEST(body_until_close) {
    ByteChannel<4096> ch;
    ch.init();
    std::thread writer = feed(ch, {"STATUS 200 OK\r\n\r\n", "part1-", "part2"}, true);

    BodyState state;
    state.reset_for(Assembler::parse(ch));
    ResponseBody<ByteChannel<4096>> body(&ch, &state);

    ASSERT_FALSE(body.has_length());
    ASSERT_EQ(body.read_all(), std::string("part1-part2"));
    ASSERT_TRUE(body.is_complete());
    writer.join();
}

TEST(body_truncated_by_close) {
    ByteChannel<4096> ch;
    ch.init();
    std::thread writer = feed(ch, {"STATUS 200 OK\r\nContent-Length: 10\r\n\r\nabc"}, true);

    BodyState state;
    state.reset_for(Assembler::parse(ch));
    ResponseBody<ByteChannel<4096>> body(&ch, &state);

    char buf[16];
    ASSERT_EQ(body.read(buf, sizeof(buf)), 3u);
    ASSERT_EQ(body.remaining(), 7u);
    ASSERT_THROWS(body.read(buf, sizeof(buf)), MalformedResponse);
    writer.join();
}

TEST(no_content_status_has_empty_body) {
    ByteChannel<4096> ch;
    ch.init();
    std::string resp = "STATUS 204 No Content\r\n\r\n";
    ch.write(resp.data(), resp.size());

    BodyState state;
    state.reset_for(Assembler::parse(ch));
    ASSERT_TRUE(state.done);
    ResponseBody<ByteChannel<4096>> body(&ch, &state);
    ASSERT_EQ(body.read_all(), std::string(""));
}

TEST(stale_body_handle_rejected) {
    ByteChannel<4096> ch;
    ch.init();
    std::string resp = "STATUS 200 OK\r\nContent-Length: 2\r\n\r\nok";
    ch.write(resp.data(), resp.size());
    ch.write(resp.data(), resp.size());

    BodyState state;
    state.reset_for(Assembler::parse(ch));
    ResponseBody<ByteChannel<4096>> first(&ch, &state);
    first.drain();

    state.reset_for(Assembler::parse(ch));
    ASSERT_THROWS(first.next_chunk(), InvalidState);

    ResponseBody<ByteChannel<4096>> second(&ch, &state);
    ASSERT_EQ(second.read_all(), std::string("ok"));
}

// ============================================================================
// Main
// ============================================================================

int main() {
    return run_all_tests("ResponseAssembler");
}

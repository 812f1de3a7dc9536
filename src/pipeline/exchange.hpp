// pipeline/exchange.hpp
// Caller-side views of one request/response exchange
//
//   RequestSink<Channel>   - serialization target handed to Request::write_to(),
//                            copies straight into the outbound channel
//   ResponseBody<Channel>  - streaming handle over the inbound channel,
//                            positioned right after the response head
//   Exchange<Channel>      - parsed head + body handle returned by send_request()
//
// Body framing:
//   - 1xx/204/304 responses: empty body
//   - Content-Length present: exactly that many bytes
//   - otherwise: everything until the peer closes the connection
//
// C++20, header-only
#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "../core/byte_channel.hpp"
#include "../core/error.hpp"
#include "../core/http.hpp"

namespace sockclient::pipeline {

// ============================================================================
// RequestSink
// ============================================================================

/**
 * RequestSink - writes request bytes into the outbound channel
 *
 * Bytes become visible to the Sender on flush() or whenever the channel
 * fills up. Throws TransportError once the channel stops accepting data
 * (session closing or Sender failed).
 */
template<typename Channel>
class RequestSink {
public:
    explicit RequestSink(Channel& channel) : channel_(channel) {}

    void write(const void* data, size_t len) {
        const uint8_t* src = static_cast<const uint8_t*>(data);
        while (len > 0) {
            size_t avail = 0;
            uint8_t* dst = next_region(&avail);
            size_t n = std::min(avail, len);
            std::memcpy(dst, src, n);
            commit(n);
            src += n;
            len -= n;
        }
    }

    void write(std::string_view s) {
        write(s.data(), s.size());
    }

    // Zero-copy: fill up to *len bytes at the returned pointer, then commit()
    uint8_t* next_region(size_t* len) {
        uint8_t* dst = channel_.next_write_region(len);
        if (!dst) {
            throw TransportError("Connection closed while writing request");
        }
        return dst;
    }

    void commit(size_t n) {
        channel_.commit_write(n);
        written_ += n;
    }

    void flush() {
        if (!channel_.flush()) {
            throw TransportError("Connection closed while writing request");
        }
    }

    size_t bytes_written() const { return written_; }

private:
    Channel& channel_;
    size_t written_ = 0;
};

// ============================================================================
// ResponseBody
// ============================================================================

/**
 * Framing state of the body in flight, owned by the session so it can tell
 * whether the previous exchange has been fully consumed.
 */
struct BodyState {
    bool until_close = false;   // no Content-Length: body ends at peer close
    uint64_t remaining = 0;     // bytes left when length-delimited
    bool done = true;
    bool failed = false;        // body ended in an error; stream position lost
    uint64_t generation = 0;    // bumped on every exchange

    void reset_for(const http::ResponseHead& head) {
        generation++;
        failed = false;
        uint64_t length = 0;
        if (head.has_no_body()) {
            until_close = false;
            remaining = 0;
        } else if (head.content_length(&length)) {
            until_close = false;
            remaining = length;
        } else {
            until_close = true;
            remaining = 0;
        }
        done = !until_close && remaining == 0;
    }

    void fail() {
        done = true;
        failed = true;
        remaining = 0;
    }
};

/**
 * ResponseBody - streaming, read-only handle over the response body
 *
 * Zero-copy use:
 *   for (;;) {
 *       SplitRegion chunk = body.next_chunk();
 *       if (chunk.total() == 0) break;
 *       process(chunk);
 *       body.consume(chunk.total());
 *   }
 *
 * Valid until the next send_request() on the same session. A stale handle
 * (older exchange) throws InvalidState.
 */
template<typename Channel>
class ResponseBody {
public:
    ResponseBody() = default;
    ResponseBody(Channel* channel, BodyState* state)
        : channel_(channel)
        , state_(state)
        , generation_(state ? state->generation : 0)
    {}

    /**
     * Wait for the next body bytes
     *
     * @return Region over buffered body bytes; empty at end of body
     * @throws MalformedResponse if the peer closes before Content-Length bytes
     * @throws TransportError if the connection fails
     *
     * Either error ends the body for good; the session refuses further
     * exchanges.
     */
    SplitRegion next_chunk() {
        check_current();
        SplitRegion empty = {nullptr, 0, nullptr, 0};
        if (state_->done) {
            return empty;
        }

        ReadResult r;
        try {
            r = channel_->read();
        } catch (const ExchangeError&) {
            state_->fail();
            throw;
        }
        size_t avail = r.region.total();
        if (!state_->until_close && avail > state_->remaining) {
            avail = static_cast<size_t>(state_->remaining);
        }

        if (avail == 0) {
            if (state_->until_close) {
                state_->done = true;
                return empty;
            }
            uint64_t outstanding = state_->remaining;
            state_->fail();
            throw MalformedResponse("Connection closed with " + std::to_string(outstanding) +
                                    " body bytes outstanding");
        }

        return clip(r.region, avail);
    }

    // Release n bytes of the last chunk
    void consume(size_t n) {
        check_current();
        if (n == 0) return;
        channel_->advance(n);
        if (!state_->until_close) {
            state_->remaining -= std::min<uint64_t>(n, state_->remaining);
            if (state_->remaining == 0) {
                state_->done = true;
            }
        }
    }

    /**
     * Copy up to len body bytes into buf
     *
     * @return Bytes copied, 0 at end of body
     */
    size_t read(void* buf, size_t len) {
        if (len == 0) return 0;
        SplitRegion chunk = next_chunk();
        size_t n = std::min(len, chunk.total());
        if (n == 0) return 0;
        chunk.copy_to(static_cast<uint8_t*>(buf), 0, n);
        consume(n);
        return n;
    }

    std::string read_all() {
        std::string out;
        for (;;) {
            SplitRegion chunk = next_chunk();
            if (chunk.total() == 0) break;
            out.append(reinterpret_cast<const char*>(chunk.ptr1), chunk.len1);
            if (chunk.len2) {
                out.append(reinterpret_cast<const char*>(chunk.ptr2), chunk.len2);
            }
            consume(chunk.total());
        }
        return out;
    }

    // Discard the rest of the body
    void drain() {
        for (;;) {
            SplitRegion chunk = next_chunk();
            if (chunk.total() == 0) break;
            consume(chunk.total());
        }
    }

    bool is_complete() const {
        return !state_ || generation_ != state_->generation || state_->done;
    }

    bool has_length() const {
        return state_ && !state_->until_close;
    }

    uint64_t remaining() const {
        return state_ ? state_->remaining : 0;
    }

private:
    void check_current() const {
        if (!channel_ || !state_ || generation_ != state_->generation) {
            throw InvalidState("Response body is no longer valid");
        }
    }

    static SplitRegion clip(const SplitRegion& region, size_t n) {
        SplitRegion out = region;
        if (n <= out.len1) {
            out.len1 = n;
            out.ptr2 = nullptr;
            out.len2 = 0;
        } else {
            out.len2 = n - out.len1;
        }
        return out;
    }

    Channel* channel_ = nullptr;
    BodyState* state_ = nullptr;
    uint64_t generation_ = 0;
};

// ============================================================================
// Exchange
// ============================================================================

template<typename Channel>
struct Exchange {
    http::ResponseHead head;
    ResponseBody<Channel> body;
};

} // namespace sockclient::pipeline

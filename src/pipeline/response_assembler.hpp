// pipeline/response_assembler.hpp
// Incremental response head assembly from the inbound channel
//
// Reads whatever the Receiver has published, feeds it to a parser and
// releases exactly the bytes the parser absorbed:
//   - status line incomplete:  advance(0, all)        wait for more bytes
//   - some header lines done:  advance(absorbed, all) never re-parse them
//   - empty line reached:      advance(head_len)      body starts at head
//
// A fresh parser is constructed for every exchange.
//
// Errors (MalformedResponse):
//   - end-of-stream before the head is complete
//   - parser reports a syntax error
//   - the unconsumed head fills the whole inbound buffer
//   - Content-Length is not a decimal integer
// Channel errors (TransportError) propagate unchanged.
#pragma once

#include <cstdint>
#include <string>

#include "../core/byte_channel.hpp"
#include "../core/error.hpp"
#include "../core/http.hpp"
#include "../core/trace.hpp"

namespace sockclient::pipeline {

template<typename Parser = http::ResponseParser>
class ResponseAssembler {
public:
    template<typename Channel>
    static http::ResponseHead parse(Channel& inbound, const TraceSink& trace = {}) {
        Parser parser;
        http::ResponseHead head;
        std::string scratch;
        bool status_done = false;
        bool traced = false;

        for (;;) {
            ReadResult r = inbound.read();
            const SplitRegion& region = r.region;
            size_t total = region.total();

            // Parser wants contiguous bytes; only a wrapped region is copied
            const uint8_t* data = region.ptr1;
            if (region.is_split()) {
                scratch.resize(total);
                region.copy_to(reinterpret_cast<uint8_t*>(scratch.data()), 0, total);
                data = reinterpret_cast<const uint8_t*>(scratch.data());
            }

            if (!traced && total > 0) {
                trace_bytes(trace, "RESPONSE", data, total);
                traced = true;
            }

            size_t pos = 0;
            if (!status_done) {
                http::ParseResult res = parser.parse_status_line(data, total, head);
                if (res.status == http::ParseStatus::Invalid) {
                    throw MalformedResponse("Malformed status line");
                }
                if (res.status == http::ParseStatus::Complete) {
                    pos = res.consumed;
                    status_done = true;
                }
            }

            if (status_done) {
                http::ParseResult res = parser.parse_headers(data + pos, total - pos, head.headers);
                if (res.status == http::ParseStatus::Invalid) {
                    throw MalformedResponse("Malformed header line");
                }
                pos += res.consumed;
                if (res.status == http::ParseStatus::Complete) {
                    inbound.advance(pos);
                    uint64_t length = 0;
                    head.content_length(&length);  // validates the value
                    SOCKCLIENT_DEBUG_PRINT("[RESPONSE] %s %d %s (%zu headers)\n", head.version.c_str(),
                                           head.status_code, head.reason.c_str(), head.headers.size());
                    return head;
                }
            }

            if (r.completed) {
                throw MalformedResponse(status_done
                    ? "Connection closed before response headers were complete"
                    : "Connection closed before status line was complete");
            }
            if (r.buffer_full && pos == 0) {
                throw MalformedResponse("Response head exceeds inbound buffer capacity");
            }
            inbound.advance(pos, total);
        }
    }
};

} // namespace sockclient::pipeline

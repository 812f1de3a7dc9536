// client_policies.hpp
// Policy interface documentation and requirements
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "core/byte_channel.hpp"
#include "core/http.hpp"

// Policy-based design interfaces for sockclient
// Each policy defines a compile-time behavioral aspect of ClientSession

// ============================================================================
// RequestMessage: Serializes itself into a byte sink
// ============================================================================
// Required methods:
//   void write_to(Sink& sink) const
//     - Writes the complete request (line, headers, body) to the sink
//     - Sink offers write(const void*, size_t), write(std::string_view),
//       next_region(size_t*), commit(size_t) for zero-copy producers
//
// Implementations:
//   - http::Request: method, target, version, headers, optional body

// ============================================================================
// ResponseHandler: Receives a parsed response
// ============================================================================
// Required methods:
//   default constructible
//   void on_status_line(std::string_view version, int code, std::string_view reason)
//   void on_header(std::string_view name, std::string_view value)
//   void on_body(Body body)
//     - Body is a ResponseBody handle; reading it streams from the connection

// ============================================================================
// ResponseParser: Incremental response head grammar
// ============================================================================
// Required methods:
//   http::ParseResult parse_status_line(const uint8_t* data, size_t len, http::ResponseHead& head)
//   http::ParseResult parse_headers(const uint8_t* data, size_t len, http::HeaderMap& headers)
//     - consumed = bytes absorbed; parse_headers reports complete lines even
//       on NeedMoreData
//
// Implementations:
//   - http::ResponseParser: CRLF status line + "Name: value" headers

// ============================================================================
// Channel: Bounded byte channel between caller and transport loops
// ============================================================================
// Implementations:
//   - ByteChannel<Capacity>: mirrored ring buffer with blocking flow control

namespace sockclient {

template<typename R, typename Sink>
concept RequestMessageFor = requires(const R& request, Sink& sink) {
    request.write_to(sink);
};

// Checked against the string sink; write_to is normally a template
template<typename R>
concept RequestMessage = RequestMessageFor<R, http::StringSink>;

template<typename T, typename Body>
concept ResponseHandler = std::default_initializable<T> &&
    requires(T handler, std::string_view sv, int code, Body body) {
        handler.on_status_line(sv, code, sv);
        handler.on_header(sv, sv);
        handler.on_body(body);
    };

template<typename P>
concept ResponseParserPolicy = std::default_initializable<P> &&
    requires(P parser, const uint8_t* data, size_t len, http::ResponseHead& head, http::HeaderMap& headers) {
        { parser.parse_status_line(data, len, head) } -> std::same_as<http::ParseResult>;
        { parser.parse_headers(data, len, headers) } -> std::same_as<http::ParseResult>;
    };

template<typename C>
concept ChannelPolicy = requires(C channel, size_t n, size_t* len, const void* data) {
    { channel.next_write_region(len) } -> std::same_as<uint8_t*>;
    { channel.commit_write(n) } -> std::same_as<void>;
    { channel.flush() } -> std::same_as<bool>;
    { channel.write(data, n) } -> std::same_as<bool>;
    { channel.read() } -> std::same_as<ReadResult>;
    { channel.advance(n) } -> std::same_as<void>;
    { channel.advance(n, n) } -> std::same_as<void>;
    channel.complete();
    channel.complete_reader();
};

static_assert(RequestMessage<http::Request>);
static_assert(ResponseParserPolicy<http::ResponseParser>);
static_assert(ChannelPolicy<ByteChannel<4096>>);

} // namespace sockclient

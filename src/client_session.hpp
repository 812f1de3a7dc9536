// client_session.hpp
// ClientSession - streaming request/response client over TCP or TLS
//
// Owns one connection, two byte channels and the two transport loops:
//
//   send_request(req)
//     │  req.write_to(RequestSink) ──► outbound channel ──► Sender ──► socket
//     │
//     └─ ResponseAssembler ◄── inbound channel ◄── Receiver ◄── socket
//          returns {head, body}; body streams the remaining bytes
//
// Lifecycle:
//   Disconnected ──connect()/attach()──► Connecting ──► Connected ──close()──► Closed
//        ▲                                   │
//        └────────── connect failed ◄────────┘
//
//   - send_request() outside Connected throws InvalidState and does no I/O
//   - One exchange at a time; a new send_request() is rejected while the
//     previous response body is not fully consumed
//   - close() is idempotent, never throws, and joins both loops
//
// Template parameters:
//   OutboundCapacity - request buffer size (power of 2)
//   InboundCapacity  - response buffer size (power of 2), bounds the head size
//   Parser           - response head grammar (ResponseParserPolicy)
//   ConnectionType   - socket + SSL policy composition
//
// C++20, header-only
#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "client_policies.hpp"
#include "core/byte_channel.hpp"
#include "core/error.hpp"
#include "core/http.hpp"
#include "core/session_config.hpp"
#include "core/trace.hpp"
#include "pipeline/exchange.hpp"
#include "pipeline/response_assembler.hpp"
#include "pipeline/transport_loop.hpp"
#include "transport/connection.hpp"

namespace sockclient {

enum class SessionState : uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Closed,
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting:   return "Connecting";
        case SessionState::Connected:    return "Connected";
        case SessionState::Closed:       return "Closed";
    }
    return "Unknown";
}

template<size_t OutboundCapacity = 64 * 1024,
         size_t InboundCapacity = 256 * 1024,
         typename Parser = http::ResponseParser,
         typename ConnectionType = transport::DefaultConnection>
    requires ResponseParserPolicy<Parser>
class ClientSession {
public:
    using OutboundChannel = ByteChannel<OutboundCapacity>;
    using InboundChannel = ByteChannel<InboundCapacity>;
    using Sink = pipeline::RequestSink<OutboundChannel>;
    using Body = pipeline::ResponseBody<InboundChannel>;
    using Exchange = pipeline::Exchange<InboundChannel>;

    explicit ClientSession(SessionConfig config = SessionConfig())
        : config_(std::move(config))
    {}

    ~ClientSession() {
        close();
    }

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    /**
     * Create a session and connect it
     *
     * @throws ConnectionError if the connection or handshake fails
     */
    static std::unique_ptr<ClientSession> open(const std::string& host, uint16_t port, bool secure,
                                               SessionConfig config = SessionConfig()) {
        auto session = std::make_unique<ClientSession>(std::move(config));
        session->connect(host, port, secure);
        return session;
    }

    /**
     * Connect to host:port, optionally over TLS, and start both loops
     *
     * A close() from another thread while connecting aborts the attempt.
     *
     * @throws InvalidState unless the session is Disconnected
     * @throws ConnectionError on resolve, connect or handshake failure
     */
    void connect(const std::string& host, uint16_t port, bool secure) {
        begin_connect("connect()");
        trace(config_.trace, "connecting to %s:%u (%s)", host.c_str(), static_cast<unsigned>(port),
              secure ? "tls" : "plain");

        try {
            conn_.init(config_.socket, config_.tls);
            conn_.open(host.c_str(), port, secure);
        } catch (const ConnectionError& e) {
            trace(config_.trace, "connect failed: %s", e.what());
            abort_connect();
            throw;
        }
        finish_connect();
        trace(config_.trace, "connected to %s:%u", host.c_str(), static_cast<unsigned>(port));
    }

    /**
     * Adopt an already connected plaintext stream (socketpair, accepted
     * socket) and start both loops. The session owns fd afterwards.
     *
     * @throws InvalidState unless the session is Disconnected
     * @throws ConnectionError if fd is unusable
     */
    void attach(int fd) {
        begin_connect("attach()");
        try {
            conn_.init(config_.socket, config_.tls);
            conn_.attach(fd);
        } catch (const ConnectionError&) {
            abort_connect();
            throw;
        }
        finish_connect();
    }

    /**
     * Send a request and wait for the response head
     *
     * @return Parsed head plus a body handle valid until the next exchange
     * @throws InvalidState if not Connected or the previous body is undrained
     * @throws TransportError if the connection failed or the session closed
     * @throws MalformedResponse if the response head is invalid or cut short
     */
    template<typename Request>
        requires RequestMessageFor<Request, Sink>
    Exchange send_request(const Request& request) {
        SessionState st = state_.load(std::memory_order_acquire);
        if (st != SessionState::Connected) {
            throw InvalidState(std::string("send_request() requires a connected session (state: ") +
                               to_string(st) + ")");
        }

        std::lock_guard<std::mutex> lock(exchange_mutex_);
        check_transport();
        if (!body_state_.done) {
            throw InvalidState("Previous response body has not been fully consumed");
        }

        try {
            Sink sink(outbound_);
            request.write_to(sink);
            sink.flush();
            trace(config_.trace, "request: %zu bytes", sink.bytes_written());

            http::ResponseHead head = pipeline::ResponseAssembler<Parser>::parse(inbound_, config_.trace);
            body_state_.reset_for(head);
            return Exchange{std::move(head), Body(&inbound_, &body_state_)};
        } catch (const ExchangeError& e) {
            // Stream position is unknown after a failed exchange
            broken_ = true;
            trace(config_.trace, "exchange failed: %s", e.what());
            throw;
        }
    }

    /**
     * Send a request and deliver the response to a handler object
     *
     * Calls on_status_line(), on_header() for each header in order, then
     * on_body() with the body handle.
     */
    template<typename Response, typename Request>
        requires ResponseHandler<Response, Body> && RequestMessageFor<Request, Sink>
    Response send_request_as(const Request& request) {
        Exchange exchange = send_request(request);
        Response response;
        response.on_status_line(exchange.head.version, exchange.head.status_code, exchange.head.reason);
        for (const auto& [name, value] : exchange.head.headers) {
            response.on_header(name, value);
        }
        response.on_body(exchange.body);
        return response;
    }

    /**
     * Close the session: fail any pending exchange, stop and join both
     * loops, release TLS and the socket. Idempotent.
     */
    void close() noexcept {
        SessionState prev = state_.exchange(SessionState::Closed, std::memory_order_acq_rel);
        switch (prev) {
            case SessionState::Closed:
            case SessionState::Disconnected:
                return;
            case SessionState::Connecting:
                // Connecting thread observes the state change and tears down
                conn_.shutdown();
                return;
            case SessionState::Connected:
                teardown();
                trace(config_.trace, "session closed");
                return;
        }
    }

    SessionState state() const {
        return state_.load(std::memory_order_acquire);
    }

    bool is_connected() const {
        return state() == SessionState::Connected && !inbound_.is_completed() &&
               !receiver_.finished() && !sender_.finished();
    }

    // Response bytes buffered locally or waiting in the socket/TLS layer
    bool has_data() {
        if (state() != SessionState::Connected) return false;
        return inbound_.readable() > 0 || conn_.has_data();
    }

    const SessionConfig& config() const { return config_; }

    // Applies to loops started by the next connect()/attach()
    void set_trace(TraceSink sink) {
        config_.trace = std::move(sink);
    }

    uint64_t bytes_sent() const { return sender_.bytes_sent(); }
    uint64_t bytes_received() const { return receiver_.bytes_received(); }

private:
    void begin_connect(const char* op) {
        SessionState expected = SessionState::Disconnected;
        if (!state_.compare_exchange_strong(expected, SessionState::Connecting, std::memory_order_acq_rel)) {
            throw InvalidState(std::string(op) + " requires a disconnected session (state: " +
                               to_string(expected) + ")");
        }
    }

    // Failed attempt: back to Disconnected unless close() got there first
    void abort_connect() noexcept {
        conn_.close();
        SessionState expected = SessionState::Connecting;
        state_.compare_exchange_strong(expected, SessionState::Disconnected, std::memory_order_acq_rel);
    }

    void finish_connect() {
        try {
            conn_.set_nonblocking();
            outbound_.init();
            inbound_.init();
            body_state_ = pipeline::BodyState{};
            broken_ = false;
            receiver_.start(conn_, outbound_, inbound_, config_.poll_interval_ms, config_.trace);
            sender_.start(conn_, outbound_, inbound_, config_.poll_interval_ms, config_.trace);
        } catch (const std::runtime_error& e) {
            teardown();
            abort_connect();
            throw ConnectionError(std::string("Failed to start transport: ") + e.what());
        }

        SessionState expected = SessionState::Connecting;
        if (!state_.compare_exchange_strong(expected, SessionState::Connected, std::memory_order_acq_rel)) {
            teardown();
            throw ConnectionError("Session closed while connecting");
        }
    }

    void check_transport() {
        if (broken_ || body_state_.failed) {
            throw TransportError("Connection unusable after a failed exchange");
        }
        if (std::exception_ptr err = receiver_.error()) {
            throw TransportError(pipeline::describe(err));
        }
        if (std::exception_ptr err = sender_.error()) {
            throw TransportError(pipeline::describe(err));
        }
        // Inbound completes before the Receiver thread is marked finished
        if (receiver_.finished() || inbound_.is_completed()) {
            // Bytes past the last body are the start of a head the peer
            // never finished
            if (body_state_.done && receiver_.peer_closed() && inbound_.readable() > 0) {
                broken_ = true;
                throw MalformedResponse("Connection closed before a complete response head");
            }
            throw TransportError("Connection closed by peer");
        }
        if (sender_.finished()) {
            throw TransportError("Sender stopped");
        }
    }

    void teardown() noexcept {
        sender_.stop();
        receiver_.stop();

        // Wake the caller and both loops wherever they are blocked
        inbound_.complete(std::make_exception_ptr(TransportError("Session closed")));
        inbound_.complete_reader();
        outbound_.complete();
        outbound_.complete_reader();
        conn_.shutdown();

        sender_.join();
        receiver_.join();

        if (std::exception_ptr err = sender_.error()) {
            SOCKCLIENT_DEBUG_PRINT("[Session] Sender error: %s\n", pipeline::describe(err).c_str());
            trace(config_.trace, "sender error: %s", pipeline::describe(err).c_str());
        }
        if (std::exception_ptr err = receiver_.error()) {
            SOCKCLIENT_DEBUG_PRINT("[Session] Receiver error: %s\n", pipeline::describe(err).c_str());
            trace(config_.trace, "receiver error: %s", pipeline::describe(err).c_str());
        }

        conn_.close();
    }

    SessionConfig config_;
    std::atomic<SessionState> state_{SessionState::Disconnected};

    ConnectionType conn_;
    OutboundChannel outbound_;
    InboundChannel inbound_;
    pipeline::SenderLoop<ConnectionType, OutboundChannel, InboundChannel> sender_;
    pipeline::ReceiverLoop<ConnectionType, OutboundChannel, InboundChannel> receiver_;

    std::mutex exchange_mutex_;
    pipeline::BodyState body_state_;
    bool broken_ = false;
};

} // namespace sockclient

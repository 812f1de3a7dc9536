// pipeline/transport_loop.hpp
// Sender and Receiver - background threads moving bytes between the
// connection and the two byte channels
//
//   caller ──write──► [outbound ByteChannel] ──► SenderLoop ──► connection
//   caller ◄──read─── [inbound ByteChannel]  ◄── ReceiverLoop ◄── connection
//
// Each loop is owned through a task handle: start(), stop(), join(),
// finished(), error(). A loop that fails records the exception, completes
// BOTH channels with a TransportError so every blocked caller wakes with it,
// and exits. stop() asks the loop to exit at its next wake-up; loops wake at
// least every poll_interval_ms.
//
// Threads block SIGPIPE for their lifetime: TLS writes go through write(),
// and a dead peer must surface as an error return rather than a signal.
//
// C++20, policy-based design
#pragma once

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <pthread.h>
#include <string>
#include <thread>

#include "../core/byte_channel.hpp"
#include "../core/error.hpp"
#include "../core/trace.hpp"
#include "../policy/event.hpp"

namespace sockclient::pipeline {

// Message of an exception_ptr, for logging and wrapping
inline std::string describe(std::exception_ptr err) {
    if (!err) return "no error";
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

/**
 * LoopTask - joinable handle around one loop thread
 */
class LoopTask {
public:
    explicit LoopTask(const char* name) : name_(name) {}

    ~LoopTask() {
        stop();
        join();
    }

    LoopTask(const LoopTask&) = delete;
    LoopTask& operator=(const LoopTask&) = delete;

    template<typename Fn>
    void start(Fn&& fn) {
        stop_requested_.store(false, std::memory_order_release);
        finished_.store(false, std::memory_order_release);
        error_ = nullptr;
        thread_ = std::thread([this, fn = std::forward<Fn>(fn)]() mutable {
            sigset_t block;
            sigemptyset(&block);
            sigaddset(&block, SIGPIPE);
            pthread_sigmask(SIG_BLOCK, &block, nullptr);

            try {
                fn();
            } catch (...) {
                error_ = std::current_exception();
            }
            finished_.store(true, std::memory_order_release);
            SOCKCLIENT_DEBUG_PRINT("[%s] Thread exiting\n", name_);
        });
    }

    void stop() {
        stop_requested_.store(true, std::memory_order_release);
    }

    void join() {
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
            thread_.join();
        }
    }

    bool stop_requested() const {
        return stop_requested_.load(std::memory_order_acquire);
    }

    bool finished() const {
        return finished_.load(std::memory_order_acquire);
    }

    // Failure of the loop body; only meaningful once finished()
    std::exception_ptr error() const {
        return finished() ? error_ : nullptr;
    }

    const char* name() const { return name_; }

private:
    const char* name_;
    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> finished_{false};
    std::exception_ptr error_;
};

// ============================================================================
// SenderLoop
// ============================================================================

/**
 * SenderLoop - drains the outbound channel into the connection
 *
 * Exits when the outbound channel is completed and empty, or on stop().
 * Waits for writability (epoll) only after the connection reports
 * would-block.
 */
template<typename Connection, typename OutChannel, typename InChannel>
class SenderLoop {
public:
    SenderLoop() : task_("TX") {}

    ~SenderLoop() {
        stop();
        join();
    }

    void start(Connection& conn, OutChannel& outbound, InChannel& inbound,
               int poll_interval_ms, TraceSink trace = {}) {
        conn_ = &conn;
        outbound_ = &outbound;
        inbound_ = &inbound;
        trace_ = std::move(trace);

        event_.init();
        event_.add_write(conn.get_fd());
        event_.set_wait_timeout(poll_interval_ms);

        task_.start([this]() { run(); });
    }

    void stop() { task_.stop(); }
    void join() { task_.join(); }
    bool finished() const { return task_.finished(); }
    std::exception_ptr error() const { return task_.error(); }

    uint64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }

private:
    void run() {
        try {
            for (;;) {
                ReadResult r;
                try {
                    r = outbound_->read();
                } catch (const TransportError& e) {
                    // Channel failed by the Receiver; nothing left to send
                    trace(trace_, "sender: outbound failed: %s", e.what());
                    return;
                }
                size_t total = r.region.total();
                if (task_.stop_requested()) {
                    trace(trace_, "sender: stopped");
                    return;
                }
                if (total == 0) {
                    if (r.completed) {
                        trace(trace_, "sender: outbound completed");
                        return;
                    }
                    continue;
                }

                write_all(r.region.ptr1, r.region.len1);
                if (r.region.len2) {
                    write_all(r.region.ptr2, r.region.len2);
                }
                outbound_->advance(total);
                bytes_sent_.fetch_add(total, std::memory_order_relaxed);
                trace(trace_, "sender: wrote %zu bytes", total);
            }
        } catch (const std::exception& e) {
            if (task_.stop_requested()) return;
            printf("[TX] send error: %s\n", e.what());
            trace(trace_, "sender: failed: %s", e.what());
            fail(e.what());
            throw;
        }
    }

    void write_all(const uint8_t* data, size_t len) {
        while (len > 0) {
            if (task_.stop_requested()) {
                throw TransportError("Sender stopped");
            }
            ssize_t n = conn_->write_some(data, len);
            if (n > 0) {
                data += n;
                len -= static_cast<size_t>(n);
                continue;
            }
            if (event_.wait_with_timeout() < 0 && errno != EINTR) {
                throw TransportError(std::string("epoll_wait() failed: ") + strerror(errno));
            }
        }
    }

    void fail(const char* what) {
        auto err = std::make_exception_ptr(TransportError(std::string("Send failed: ") + what));
        outbound_->complete(err);
        outbound_->complete_reader();
        inbound_->complete(err);
    }

    LoopTask task_;
    event_policies::DefaultEventPolicy event_;
    Connection* conn_ = nullptr;
    OutChannel* outbound_ = nullptr;
    InChannel* inbound_ = nullptr;
    TraceSink trace_;
    std::atomic<uint64_t> bytes_sent_{0};
};

// ============================================================================
// ReceiverLoop
// ============================================================================

/**
 * ReceiverLoop - pumps connection bytes into the inbound channel
 *
 * Waits for readability (or TLS-buffered bytes), then reads straight into
 * the channel's write region until the connection would block. A zero-byte
 * read is a graceful close: the inbound channel is completed and the loop
 * exits. Back-pressure: a full inbound channel blocks the loop, and the
 * kernel receive window does the rest.
 */
template<typename Connection, typename OutChannel, typename InChannel>
class ReceiverLoop {
public:
    ReceiverLoop() : task_("RX") {}

    ~ReceiverLoop() {
        stop();
        join();
    }

    void start(Connection& conn, OutChannel& outbound, InChannel& inbound,
               int poll_interval_ms, TraceSink trace = {}) {
        conn_ = &conn;
        outbound_ = &outbound;
        inbound_ = &inbound;
        trace_ = std::move(trace);

        event_.init();
        event_.add_read(conn.get_fd());
        event_.set_wait_timeout(poll_interval_ms);

        task_.start([this]() { run(); });
    }

    void stop() { task_.stop(); }
    void join() { task_.join(); }
    bool finished() const { return task_.finished(); }
    std::exception_ptr error() const { return task_.error(); }

    // Peer closed the stream gracefully
    bool peer_closed() const { return peer_closed_.load(std::memory_order_acquire); }

    uint64_t bytes_received() const { return bytes_received_.load(std::memory_order_relaxed); }

private:
    void run() {
        try {
            while (!task_.stop_requested()) {
                if (conn_->buffered() == 0) {
                    int n = event_.wait_with_timeout();
                    if (n == 0) continue;
                    if (n < 0) {
                        if (errno == EINTR) continue;
                        throw TransportError(std::string("epoll_wait() failed: ") + strerror(errno));
                    }
                }
                if (!drain()) return;
            }
            trace(trace_, "receiver: stopped");
        } catch (const std::exception& e) {
            if (task_.stop_requested()) return;
            printf("[RX] recv error: %s\n", e.what());
            trace(trace_, "receiver: failed: %s", e.what());
            fail(e.what());
            throw;
        }
    }

    // Returns false when the loop should exit
    bool drain() {
        for (;;) {
            size_t avail = 0;
            uint8_t* dst = inbound_->next_write_region(&avail);
            if (!dst) {
                trace(trace_, "receiver: inbound closed");
                return false;
            }

            ssize_t n = conn_->read_some(dst, avail);
            if (n > 0) {
                inbound_->commit_write(static_cast<size_t>(n));
                bytes_received_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
                trace_bytes(trace_, "RECEIVED", dst, static_cast<size_t>(n), 128);
                if (!inbound_->flush()) return false;
                continue;
            }
            if (n == 0) {
                SOCKCLIENT_DEBUG_PRINT("[RX] Connection closed by peer\n");
                trace(trace_, "receiver: connection closed by peer");
                peer_closed_.store(true, std::memory_order_release);
                inbound_->complete();
                return false;
            }
            return true;  // would block
        }
    }

    void fail(const char* what) {
        auto err = std::make_exception_ptr(TransportError(std::string("Receive failed: ") + what));
        inbound_->complete(err);
        outbound_->complete(err);
        outbound_->complete_reader();
    }

    LoopTask task_;
    event_policies::DefaultEventPolicy event_;
    Connection* conn_ = nullptr;
    OutChannel* outbound_ = nullptr;
    InChannel* inbound_ = nullptr;
    TraceSink trace_;
    std::atomic<bool> peer_closed_{false};
    std::atomic<uint64_t> bytes_received_{0};
};

} // namespace sockclient::pipeline

// src/transport/connection.hpp
// Connection - byte stream over a socket, optionally wrapped in TLS
//
// Combines a socket type and an SSL policy behind one non-blocking
// read/write contract used by the transport loops:
//   read_some():  >0 bytes, 0 = peer closed, -1 = would block
//   write_some(): >0 bytes, -1 = would block
//   Fatal errors throw TransportError.
//
// Lifecycle (caller thread):
//   init() -> open(host, port, secure) or attach(fd) -> set_nonblocking()
//   ... Sender/Receiver threads call write_some()/read_some() ...
//   shutdown()  (any thread, wakes both loops)
//   close()     (after both loops are joined)
//
// Over TLS both loops share one SSL object, so each SSL call is serialized
// by ssl_mutex_. Calls are non-blocking, so the lock is held only for the
// duration of one SSL_read/SSL_write.

#pragma once

#include "bsd_socket.hpp"
#include "../policy/ssl.hpp"
#include "../core/error.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <mutex>
#include <pthread.h>
#include <string>

namespace sockclient {
namespace transport {

/**
 * Block SIGPIPE on the current thread for the guard's lifetime
 *
 * OpenSSL writes to the socket with plain write(), so a dead peer raises
 * SIGPIPE. Any SIGPIPE generated while the guard is held is consumed before
 * the previous mask is restored.
 */
class ScopedSigpipeBlock {
public:
    ScopedSigpipeBlock() {
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        sigset_t block;
        sigemptyset(&block);
        sigaddset(&block, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &block, &old_mask_);
    }

    ~ScopedSigpipeBlock() {
        if (!was_pending_) {
            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1) {
                sigset_t sigpipe;
                sigemptyset(&sigpipe);
                sigaddset(&sigpipe, SIGPIPE);
                struct timespec zero = {0, 0};
                while (sigtimedwait(&sigpipe, nullptr, &zero) < 0 && errno == EINTR) {}
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

private:
    sigset_t old_mask_;
    bool was_pending_ = false;
};

template<typename SocketType = BSDSocket, typename SSLPolicy = ssl::OpenSSLPolicy>
class Connection {
public:
    Connection() = default;

    ~Connection() {
        close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void init(const BSDSocketConfig& socket_config, const ssl::SSLConfig& ssl_config) {
        socket_config_ = socket_config;
        ssl_config_ = ssl_config;
    }

    /**
     * Connect to host:port and optionally run the TLS handshake
     *
     * Leaves the socket in blocking mode; call set_nonblocking() before
     * handing the connection to the transport loops.
     *
     * @throws ConnectionError on resolve, connect or handshake failure
     */
    void open(const char* host, uint16_t port, bool secure) {
        socket_.init(socket_config_);
        try {
            socket_.connect(host, port);
        } catch (const std::runtime_error& e) {
            throw ConnectionError(std::string("Failed to connect to ") + host + ":" +
                                  std::to_string(port) + ": " + e.what());
        }

        if (secure) {
            ScopedSigpipeBlock no_sigpipe;
            try {
                ssl_.init(ssl_config_);
                ssl_.handshake(socket_.get_fd(), host);
            } catch (const std::runtime_error& e) {
                ssl_.shutdown();
                socket_.close();
                throw ConnectionError(std::string("TLS handshake with ") + host + " failed: " + e.what());
            }
            secure_ = true;
        }
        shut_down_.store(false);
    }

    /**
     * Adopt an already connected plaintext stream descriptor
     *
     * @throws ConnectionError if the descriptor is invalid
     */
    void attach(int fd) {
        socket_.init(socket_config_);
        try {
            socket_.attach(fd);
        } catch (const std::runtime_error& e) {
            throw ConnectionError(e.what());
        }
        secure_ = false;
        shut_down_.store(false);
    }

    void set_nonblocking() {
        try {
            socket_.set_nonblocking();
        } catch (const std::runtime_error& e) {
            throw ConnectionError(e.what());
        }
    }

    /**
     * @return >0 bytes read, 0 on peer close, -1 if no data is ready
     * @throws TransportError on socket or TLS failure
     */
    ssize_t read_some(void* buf, size_t len) {
        if (secure_) {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            try {
                return ssl_.read(buf, len);
            } catch (const std::runtime_error& e) {
                throw TransportError(e.what());
            }
        }

        ssize_t n = socket_.recv(buf, len);
        if (n >= 0) return n;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return -1;
        if (shut_down_.load() && (errno == EBADF || errno == ENOTCONN)) return 0;
        throw TransportError(std::string("recv() failed: ") + strerror(errno));
    }

    /**
     * @return >0 bytes written, -1 if the socket buffer is full
     * @throws TransportError on socket or TLS failure
     */
    ssize_t write_some(const void* buf, size_t len) {
        if (secure_) {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            try {
                return ssl_.write(buf, len);
            } catch (const std::runtime_error& e) {
                throw TransportError(e.what());
            }
        }

        ssize_t n = socket_.send(buf, len);
        if (n >= 0) return n;
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return -1;
        throw TransportError(std::string("send() failed: ") + strerror(errno));
    }

    // Decrypted bytes already buffered inside TLS (not visible to epoll)
    size_t buffered() {
        if (!secure_) return 0;
        std::lock_guard<std::mutex> lock(ssl_mutex_);
        return ssl_.pending();
    }

    // Bytes readable without blocking: TLS buffer plus kernel receive queue
    size_t available() {
        return buffered() + socket_.available();
    }

    bool has_data() {
        return available() > 0;
    }

    bool is_secure() const { return secure_; }

    bool is_open() const { return socket_.get_fd() >= 0; }

    int get_fd() const { return socket_.get_fd(); }

    // Wake both loops; safe from any thread, descriptor stays valid
    void shutdown() {
        shut_down_.store(true);
        socket_.shutdown();
    }

    // Release TLS and the descriptor; loops must already be joined
    void close() {
        if (secure_) {
            ScopedSigpipeBlock no_sigpipe;
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ssl_.shutdown();
            secure_ = false;
        }
        socket_.close();
    }

private:
    SocketType socket_;
    SSLPolicy ssl_;
    BSDSocketConfig socket_config_;
    ssl::SSLConfig ssl_config_;
    std::mutex ssl_mutex_;
    bool secure_ = false;
    std::atomic<bool> shut_down_{false};
};

using DefaultConnection = Connection<BSDSocket, ssl::OpenSSLPolicy>;

} // namespace transport
} // namespace sockclient

// src/transport/bsd_socket.hpp
// BSD Socket - TCP stream over the kernel stack
//
// Policy-based design: No inheritance, no virtual functions
// Resolves the host (IPv4 and IPv6), connects with a timeout, then hands the
// descriptor to the caller in blocking mode so a TLS handshake can run on it.
// The session later switches it to non-blocking for the transport loops.

#pragma once

#include "../core/trace.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <errno.h>
#include <cstring>
#include <string>
#include <stdexcept>

namespace sockclient {
namespace transport {

/**
 * BSD Socket Configuration (optional)
 */
struct BSDSocketConfig {
    bool tcp_nodelay;         // Disable Nagle's algorithm (default: true)
    int connect_timeout_ms;   // Per-address connect timeout (default: 5000)

    BSDSocketConfig()
        : tcp_nodelay(true)
        , connect_timeout_ms(5000)
    {}
};

/**
 * BSDSocket - Socket interface using standard BSD sockets
 *
 * Socket Interface (duck typing):
 *   void init(const BSDSocketConfig& config)
 *   void connect(const char* host, uint16_t port)
 *   void attach(int fd)
 *   void set_nonblocking()
 *   ssize_t send(const void* data, size_t len)
 *   ssize_t recv(void* buffer, size_t len)
 *   size_t available() const
 *   void shutdown()
 *   void close()
 *   int get_fd() const
 *
 * shutdown() may be called from another thread while send/recv are in
 * progress; close() must not.
 */
struct BSDSocket {
    std::atomic<int> fd_;
    bool connected_;
    BSDSocketConfig config_;

    BSDSocket()
        : fd_(-1)
        , connected_(false)
    {}

    ~BSDSocket() {
        close();
    }

    BSDSocket(const BSDSocket&) = delete;
    BSDSocket& operator=(const BSDSocket&) = delete;

    // =====================
    // Socket Interface
    // =====================

    void init(const BSDSocketConfig& config = BSDSocketConfig()) {
        config_ = config;
    }

    /**
     * Resolve host and connect, trying each returned address in order
     *
     * @throws std::runtime_error with the last failure if no address connects
     */
    void connect(const char* host, uint16_t port) {
        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        char port_str[8];
        snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port));

        int ret = getaddrinfo(host, port_str, &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }
        if (!result) {
            throw std::runtime_error("getaddrinfo() returned no addresses");
        }

        std::string last_error = "no usable address";
        for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
            if (fd < 0) {
                last_error = std::string("socket() failed: ") + strerror(errno);
                continue;
            }
            fd_.store(fd);
            if (connect_one(ai->ai_addr, ai->ai_addrlen, &last_error)) {
                freeaddrinfo(result);
                apply_options();
                connected_ = true;
                SOCKCLIENT_DEBUG_PRINT("[BSD Socket] Connected to %s:%u\n", host, static_cast<unsigned>(port));
                return;
            }
            int to_close = fd_.exchange(-1);
            if (to_close >= 0) ::close(to_close);
        }

        freeaddrinfo(result);
        throw std::runtime_error(last_error);
    }

    /**
     * Adopt an already connected stream socket (takes ownership)
     */
    void attach(int fd) {
        if (fd < 0) {
            throw std::runtime_error("attach() given invalid descriptor");
        }
        close();
        fd_.store(fd);
        connected_ = true;
        apply_options();
    }

    void set_nonblocking() {
        int fd = fd_.load();
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            throw std::runtime_error(std::string("Failed to set non-blocking mode: ") + strerror(errno));
        }
    }

    // Wake any thread blocked on this socket; descriptor stays valid
    void shutdown() {
        int fd = fd_.load();
        if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void close() {
        int fd = fd_.exchange(-1);
        if (fd >= 0) {
            ::close(fd);
        }
        connected_ = false;
    }

    bool is_connected() const {
        return connected_ && fd_.load() >= 0;
    }

    ssize_t send(const void* data, size_t len) {
        int fd = fd_.load();
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        return ::send(fd, data, len, MSG_NOSIGNAL);
    }

    ssize_t recv(void* buffer, size_t len) {
        int fd = fd_.load();
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        return ::recv(fd, buffer, len, 0);
    }

    // Bytes queued in the kernel receive buffer
    size_t available() const {
        int fd = fd_.load();
        int n = 0;
        if (fd < 0 || ioctl(fd, FIONREAD, &n) < 0 || n < 0) {
            return 0;
        }
        return static_cast<size_t>(n);
    }

    int get_fd() const {
        return fd_.load();
    }

private:
    bool connect_one(const struct sockaddr* addr, socklen_t addrlen, std::string* error) {
        int fd = fd_.load();

        // Set non-blocking mode for timeout support
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            *error = "Failed to set non-blocking mode";
            return false;
        }

        int ret = ::connect(fd, addr, addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            *error = std::string("connect() failed: ") + strerror(errno);
            return false;
        }

        if (ret < 0) {  // EINPROGRESS
            fd_set write_fds, error_fds;
            FD_ZERO(&write_fds);
            FD_ZERO(&error_fds);
            FD_SET(fd, &write_fds);
            FD_SET(fd, &error_fds);

            struct timeval tv;
            tv.tv_sec = config_.connect_timeout_ms / 1000;
            tv.tv_usec = (config_.connect_timeout_ms % 1000) * 1000;

            ret = select(fd + 1, nullptr, &write_fds, &error_fds, &tv);
            if (ret <= 0) {
                if (ret == 0) {
                    *error = "connect() timeout after " + std::to_string(config_.connect_timeout_ms) + " ms";
                } else {
                    *error = std::string("select() failed: ") + strerror(errno);
                }
                return false;
            }

            int sock_error = 0;
            socklen_t len = sizeof(sock_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_error, &len) < 0) {
                *error = "getsockopt() failed";
                return false;
            }
            if (sock_error != 0) {
                *error = std::string("connect() failed: ") + strerror(sock_error);
                return false;
            }
        }

        // Restore blocking mode
        if (fcntl(fd, F_SETFL, flags) < 0) {
            *error = "Failed to restore blocking mode";
            return false;
        }
        return true;
    }

    void apply_options() {
        if (!config_.tcp_nodelay) return;
        int flag = 1;
        int fd = fd_.load();
        // Fails harmlessly on non-TCP streams (socketpair)
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0 && errno != EOPNOTSUPP &&
            errno != ENOPROTOOPT) {
            printf("[WARN] Failed to set TCP_NODELAY: %s\n", strerror(errno));
        }
    }
};

} // namespace transport
} // namespace sockclient

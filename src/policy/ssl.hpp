// policy/ssl.hpp
// SSL/TLS Policy - OpenSSL client (LibreSSL is API compatible)
//
// The policy conforms to the SSLPolicyConcept interface:
//   - void init(const SSLConfig&)
//   - void handshake(int fd, const char* host)
//   - ssize_t read(void* buf, size_t len)
//   - ssize_t write(const void* buf, size_t len)
//   - size_t pending() const
//   - void shutdown()
//
// Namespace: sockclient::ssl

#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <sys/types.h>
#include <arpa/inet.h>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

namespace sockclient {
namespace ssl {

/**
 * TLS configuration
 */
struct SSLConfig {
    bool verify_peer;       // Verify server certificate and hostname (default: false)
    std::string ca_file;    // PEM bundle; empty = system default paths
    int min_version;        // Minimum protocol version (default: TLS 1.2)

    SSLConfig()
        : verify_peer(false)
        , min_version(TLS1_2_VERSION)
    {}
};

// Most recent OpenSSL error queue entry as text
inline std::string last_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char err_buf[256];
    ERR_error_string_n(code, err_buf, sizeof(err_buf));
    ERR_clear_error();
    return err_buf;
}

// ============================================================================
// OpenSSL Policy
// ============================================================================

/**
 * OpenSSLPolicy - OpenSSL client implementation
 *
 * Features:
 *   - TLS 1.2+ support
 *   - SNI from the connect host name
 *   - Optional certificate and hostname verification
 *   - Non-blocking read/write after a blocking handshake
 *
 * Thread safety: Not thread-safe. Callers sharing one instance between a
 * reading and a writing thread must serialize calls (see Connection).
 */
struct OpenSSLPolicy {
    OpenSSLPolicy() : ctx_(nullptr), ssl_(nullptr) {}

    ~OpenSSLPolicy() {
        shutdown();
    }

    // Prevent copying
    OpenSSLPolicy(const OpenSSLPolicy&) = delete;
    OpenSSLPolicy& operator=(const OpenSSLPolicy&) = delete;

    // Allow moving
    OpenSSLPolicy(OpenSSLPolicy&& other) noexcept
        : ctx_(other.ctx_)
        , ssl_(other.ssl_)
        , config_(std::move(other.config_))
    {
        other.ctx_ = nullptr;
        other.ssl_ = nullptr;
    }

    OpenSSLPolicy& operator=(OpenSSLPolicy&& other) noexcept {
        if (this != &other) {
            shutdown();
            ctx_ = other.ctx_;
            ssl_ = other.ssl_;
            config_ = std::move(other.config_);
            other.ctx_ = nullptr;
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /**
     * Initialize SSL context
     *
     * @throws std::runtime_error if initialization fails
     */
    void init(const SSLConfig& config = SSLConfig()) {
        shutdown();
        config_ = config;

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new() failed: " + last_error_string());
        }

        SSL_CTX_set_min_proto_version(ctx_, config_.min_version);

        // Peers that close without close_notify read as a clean EOF
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        // Sender retries partial writes with a moved buffer pointer
        SSL_CTX_set_mode(ctx_, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (config_.verify_peer) {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
            int ok = config_.ca_file.empty()
                ? SSL_CTX_set_default_verify_paths(ctx_)
                : SSL_CTX_load_verify_locations(ctx_, config_.ca_file.c_str(), nullptr);
            if (ok != 1) {
                std::string err = last_error_string();
                shutdown();
                throw std::runtime_error("Failed to load CA certificates: " + err);
            }
        } else {
            SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
        }
    }

    /**
     * Perform TLS handshake (blocking socket expected)
     *
     * @param fd Connected socket file descriptor
     * @param host Server name for SNI and verification (may be nullptr)
     * @throws std::runtime_error if handshake fails
     */
    void handshake(int fd, const char* host = nullptr) {
        if (!ctx_) {
            throw std::runtime_error("SSL context not initialized");
        }

        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new() failed: " + last_error_string());
        }

        if (SSL_set_fd(ssl_, fd) != 1) {
            throw std::runtime_error("SSL_set_fd() failed");
        }

        if (host && *host) {
            // SNI is only sent for names, never for literal addresses
            if (!is_ip_literal(host)) {
                SSL_set_tlsext_host_name(ssl_, host);
            }
            if (config_.verify_peer) {
                if (SSL_set1_host(ssl_, host) != 1) {
                    throw std::runtime_error("SSL_set1_host() failed");
                }
            }
        }

        ERR_clear_error();
        int ret = SSL_connect(ssl_);
        if (ret != 1) {
            int err = SSL_get_error(ssl_, ret);
            std::string msg = "SSL_connect() failed";
            if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
                msg += ": connection closed during handshake";
            } else {
                msg += ": " + last_error_string();
            }
            long verify = SSL_get_verify_result(ssl_);
            if (config_.verify_peer && verify != X509_V_OK) {
                msg += " (";
                msg += X509_verify_cert_error_string(verify);
                msg += ")";
            }
            throw std::runtime_error(msg);
        }
    }

    /**
     * Read decrypted data from SSL connection
     *
     * @param buf Buffer to store data
     * @param len Buffer size
     * @return Number of bytes read, 0 on connection close, -1 on would-block
     * @throws std::runtime_error on fatal protocol or socket error
     */
    ssize_t read(void* buf, size_t len) {
        if (!ssl_) return 0;

        ERR_clear_error();
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        switch (err) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                return -1;
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_SYSCALL:
                // EOF without close_notify on older OpenSSL
                if (ERR_peek_error() == 0 && (n == 0 || errno == 0)) {
                    return 0;
                }
                throw std::runtime_error(std::string("SSL_read() failed: ") + strerror(errno));
            default:
                throw std::runtime_error("SSL_read() failed: " + last_error_string());
        }
    }

    /**
     * Write data to SSL connection
     *
     * @param buf Data to write
     * @param len Data length
     * @return Number of bytes written, -1 on would-block
     * @throws std::runtime_error on fatal error
     */
    ssize_t write(const void* buf, size_t len) {
        if (!ssl_) {
            throw std::runtime_error("SSL_write() on closed session");
        }

        ERR_clear_error();
        int n = SSL_write(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }

        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            return -1;
        }
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) {
            throw std::runtime_error(std::string("SSL_write() failed: ") + strerror(errno));
        }
        throw std::runtime_error("SSL_write() failed: " + last_error_string());
    }

    // Decrypted bytes buffered inside the SSL object
    size_t pending() const {
        if (!ssl_) return 0;
        int n = SSL_pending(ssl_);
        return n > 0 ? static_cast<size_t>(n) : 0;
    }

    bool is_established() const {
        return ssl_ != nullptr;
    }

    /**
     * Shutdown SSL connection and free resources
     */
    void shutdown() {
        if (ssl_) {
            // Best effort close_notify; socket may already be gone
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }

        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
        ERR_clear_error();
    }

    /**
     * Get SSL implementation name
     */
    static constexpr const char* name() {
        return "OpenSSL";
    }

    SSL_CTX* ctx_;
    SSL* ssl_;
    SSLConfig config_;

private:
    static bool is_ip_literal(const char* host) {
        unsigned char addr[sizeof(struct in6_addr)];
        return inet_pton(AF_INET, host, addr) == 1 || inet_pton(AF_INET6, host, addr) == 1;
    }
};

} // namespace ssl
} // namespace sockclient

// ============================================================================
// SSL Policy Concepts (C++20)
// ============================================================================

#include <concepts>

namespace sockclient {
namespace ssl {

/**
 * SSLPolicyConcept - Defines required interface for SSL policies
 *
 * All SSL policies must provide:
 *   - init(config) - Initialize SSL context
 *   - handshake(fd, host) - Perform TLS handshake
 *   - read(buf, len) - Read decrypted data (>0, 0 = closed, -1 = would block)
 *   - write(buf, len) - Write data (>0, -1 = would block)
 *   - pending() - Decrypted bytes already buffered
 *   - shutdown() - Cleanup SSL connection
 */
template<typename T>
concept SSLPolicyConcept = requires(T ssl, const SSLConfig& config, int fd, const char* host,
                                    void* buf, size_t len) {
    { ssl.init(config) } -> std::same_as<void>;
    { ssl.handshake(fd, host) } -> std::same_as<void>;
    { ssl.read(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.write(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.pending() } -> std::convertible_to<size_t>;
    { ssl.shutdown() } -> std::same_as<void>;
};

static_assert(SSLPolicyConcept<OpenSSLPolicy>);

using DefaultSSLPolicy = OpenSSLPolicy;

} // namespace ssl
} // namespace sockclient

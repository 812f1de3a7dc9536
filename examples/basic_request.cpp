// examples/basic_request.cpp
// Example: Send one request and stream the response body to stdout
//
// Usage: basic_request <host> <port> <target> [--tls] [--method M]
//
// Environment overrides (see core/session_config.hpp):
//   SOCKCLIENT_TLS_VERIFY=1, SOCKCLIENT_TLS_CA_FILE=..., SOCKCLIENT_TRACE=1
#include "../src/client_configs.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace sockclient;

// Global flag for graceful shutdown
volatile sig_atomic_t running = 1;

void signal_handler(int signum) {
    (void)signum;
    running = 0;
}

static void usage(const char* prog) {
    fprintf(stderr, "Usage: %s <host> <port> <target> [--tls] [--method M]\n", prog);
}

int main(int argc, char** argv) {
    if (argc < 4) {
        usage(argv[0]);
        return 2;
    }

    const char* host = argv[1];
    int port = atoi(argv[2]);
    if (port <= 0 || port > 65535) {
        fprintf(stderr, "Invalid port: %s\n", argv[2]);
        return 2;
    }

    http::Request request("GET", argv[3]);
    bool secure = false;
    for (int i = 4; i < argc; i++) {
        if (strcmp(argv[i], "--tls") == 0) {
            secure = true;
        } else if (strcmp(argv[i], "--method") == 0 && i + 1 < argc) {
            request.method = argv[++i];
        } else {
            usage(argv[0]);
            return 2;
        }
    }
    request.add_header("Host", host);
    request.add_header("Connection", "close");

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        DefaultClientSession session(SessionConfig::from_env());

        fprintf(stderr, "🔌 Connecting to %s:%d%s...\n", host, port, secure ? " (TLS)" : "");
        session.connect(host, static_cast<uint16_t>(port), secure);

        auto exchange = session.send_request(request);

        printf("%s %d %s\n", exchange.head.version.c_str(), exchange.head.status_code,
               exchange.head.reason.c_str());
        for (const auto& [name, value] : exchange.head.headers) {
            printf("%s: %s\n", name.c_str(), value.c_str());
        }
        printf("\n");

        // Zero-copy body streaming
        uint64_t body_bytes = 0;
        while (running) {
            SplitRegion chunk = exchange.body.next_chunk();
            if (chunk.total() == 0) break;
            fwrite(chunk.ptr1, 1, chunk.len1, stdout);
            if (chunk.len2) {
                fwrite(chunk.ptr2, 1, chunk.len2, stdout);
            }
            body_bytes += chunk.total();
            exchange.body.consume(chunk.total());
        }
        fflush(stdout);

        fprintf(stderr, "\n✅ %llu body bytes (%llu received total)\n",
                static_cast<unsigned long long>(body_bytes),
                static_cast<unsigned long long>(session.bytes_received()));
        session.close();
    } catch (const ConnectionError& e) {
        fprintf(stderr, "❌ Connection failed: %s\n", e.what());
        return 1;
    } catch (const ClientError& e) {
        fprintf(stderr, "❌ Request failed: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "❌ Error: %s\n", e.what());
        return 1;
    }

    return 0;
}

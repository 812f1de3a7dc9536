// core/session_config.hpp
// Runtime configuration for ClientSession
//
// Compile-time knobs (channel capacities, parser) are template parameters of
// ClientSession; everything tunable per deployment lives here. from_env()
// layers environment overrides on top of the defaults:
//
//   SOCKCLIENT_CONNECT_TIMEOUT_MS   socket.connect_timeout_ms
//   SOCKCLIENT_POLL_INTERVAL_MS     poll_interval_ms
//   SOCKCLIENT_TLS_VERIFY           tls.verify_peer ("1"/"true"/"yes")
//   SOCKCLIENT_TLS_CA_FILE          tls.ca_file
//   SOCKCLIENT_TRACE                install a stderr trace sink ("1")

#pragma once

#include "trace.hpp"
#include "../transport/bsd_socket.hpp"
#include "../policy/ssl.hpp"

#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <string>

namespace sockclient {

struct SessionConfig {
    transport::BSDSocketConfig socket;
    ssl::SSLConfig tls;
    int poll_interval_ms = 100;    // Loop wake-up interval to observe stop()
    TraceSink trace;               // Optional diagnostic sink

    static SessionConfig from_env() {
        SessionConfig config;

        if (const char* v = getenv("SOCKCLIENT_CONNECT_TIMEOUT_MS")) {
            int ms = atoi(v);
            if (ms > 0) config.socket.connect_timeout_ms = ms;
        }
        if (const char* v = getenv("SOCKCLIENT_POLL_INTERVAL_MS")) {
            int ms = atoi(v);
            if (ms > 0) config.poll_interval_ms = ms;
        }
        if (const char* v = getenv("SOCKCLIENT_TLS_VERIFY")) {
            config.tls.verify_peer = env_flag(v);
        }
        if (const char* v = getenv("SOCKCLIENT_TLS_CA_FILE")) {
            config.tls.ca_file = v;
        }
        if (const char* v = getenv("SOCKCLIENT_TRACE")) {
            if (env_flag(v)) config.trace = stderr_trace_sink();
        }
        return config;
    }

private:
    static bool env_flag(const char* v) {
        return strcmp(v, "1") == 0 || strcasecmp(v, "true") == 0 || strcasecmp(v, "yes") == 0;
    }
};

} // namespace sockclient

// core/trace.hpp
// Debug printing and optional diagnostic trace sink
//
// Two channels:
//   - SOCKCLIENT_DEBUG_PRINT: printf to stdout, compiled in only with -DDEBUG
//   - TraceSink: user-supplied callback receiving formatted diagnostic lines
//     (request sizes, received chunks, loop exits). May be invoked from the
//     caller thread or either transport thread.

#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#ifdef DEBUG
#define SOCKCLIENT_DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define SOCKCLIENT_DEBUG_PRINT(...) ((void)0)
#endif

namespace sockclient {

#ifdef DEBUG
constexpr bool debug_enabled = true;
#else
constexpr bool debug_enabled = false;
#endif

using TraceSink = std::function<void(std::string_view)>;

/**
 * Format and forward a line to the trace sink (no-op when sink is empty)
 */
__attribute__((format(printf, 2, 3)))
inline void trace(const TraceSink& sink, const char* fmt, ...) {
    if (!sink) return;

    char buf[512];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    if (n < 0) return;
    size_t len = static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n) : sizeof(buf) - 1;
    sink(std::string_view(buf, len));
}

/**
 * Forward a labelled byte span to the trace sink
 *
 * Non-printable bytes other than CR/LF are rendered as '.', output is capped
 * at max_len bytes so large bodies do not flood the sink.
 */
inline void trace_bytes(const TraceSink& sink, const char* label,
                        const uint8_t* data, size_t len, size_t max_len = 256) {
    if (!sink) return;

    std::string line(label);
    line += ":\n";
    size_t shown = len < max_len ? len : max_len;
    line.reserve(line.size() + shown + 32);
    for (size_t i = 0; i < shown; i++) {
        char c = static_cast<char>(data[i]);
        line += (c == '\r' || c == '\n' || (c >= 0x20 && c < 0x7f)) ? c : '.';
    }
    if (shown < len) {
        line += "... (";
        line += std::to_string(len - shown);
        line += " more bytes)";
    }
    sink(line);
}

/**
 * Trace sink writing to stderr, one line per call
 */
inline TraceSink stderr_trace_sink() {
    return [](std::string_view line) {
        fprintf(stderr, "[sockclient] %.*s\n", static_cast<int>(line.size()), line.data());
    };
}

} // namespace sockclient

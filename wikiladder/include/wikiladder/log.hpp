#pragma once
// Logging: component-tagged stderr lines
//
// log_debug is gated by the process-wide verbose flag.
// log_warn always prints; it is for recovered failures (a fetch that
// failed and was replaced by an empty result).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace wikiladder {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }

namespace detail {

inline void log_line(const char* level, const char* component, const char* fmt, va_list args) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    char msg_buf[1024];
    std::vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << level << "][" << component << "] " << msg_buf << "\n";
}

} // namespace detail

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    va_list args;
    va_start(args, fmt);
    detail::log_line("debug", component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::log_line("warn", component, fmt, args);
    va_end(args);
}

} // namespace wikiladder

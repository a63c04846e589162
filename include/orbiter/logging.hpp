#pragma once

#include <cstdio>
#include <cstdarg>

namespace orbiter {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Pipeline runs log every stage at DEBUG, so release builds default to WARN
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::WARN;
#else
inline LogLevel g_log_level = LogLevel::INFO;
#endif

// Log category enable flags for fine-grained control
struct LogCategories {
    bool modem = true;      // BPSK modulator/demodulator
    bool channel = true;    // Range loss, atmosphere, fades, AWGN
    bool fec = false;       // Hamming codec (per-codeword, very verbose)
    bool link = true;       // Packet framing and pipeline stages
    bool pass = true;       // Satellite pass scheduling
};

inline LogCategories g_log_categories;

// Set log level
inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when ORBITER_LOG_DISABLE is defined
#ifdef ORBITER_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    orbiter::log(orbiter::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    orbiter::log(orbiter::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    orbiter::log(orbiter::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (orbiter::g_log_level >= orbiter::LogLevel::DEBUG) \
        orbiter::log(orbiter::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (orbiter::g_log_level >= orbiter::LogLevel::TRACE) \
        orbiter::log(orbiter::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_MODEM(level, fmt, ...) \
    do { if (orbiter::g_log_categories.modem) LOG_##level("MODEM", fmt, ##__VA_ARGS__); } while(0)

#define LOG_CHAN(level, fmt, ...) \
    do { if (orbiter::g_log_categories.channel) LOG_##level("CHAN", fmt, ##__VA_ARGS__); } while(0)

#define LOG_FEC(level, fmt, ...) \
    do { if (orbiter::g_log_categories.fec) LOG_##level("FEC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_LINK(level, fmt, ...) \
    do { if (orbiter::g_log_categories.link) LOG_##level("LINK", fmt, ##__VA_ARGS__); } while(0)

#define LOG_PASS(level, fmt, ...) \
    do { if (orbiter::g_log_categories.pass) LOG_##level("PASS", fmt, ##__VA_ARGS__); } while(0)

} // namespace orbiter

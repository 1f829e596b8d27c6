// =============================================================================
// FILE: include/common/logger.h
// =============================================================================
#ifndef COMMON_LOGGER_H
#define COMMON_LOGGER_H

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <pthread.h>

namespace asterisk_live {

enum class LogLevel {
    kTrace = 0,
    kDebug = 1,
    kInfo  = 2,
    kWarn  = 3,
    kError = 4,
    kFatal = 5
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace: return "TRACE";
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
        case LogLevel::kFatal: return "FATAL";
    }
    return "UNKNOWN";
}

// Unknown names fall back to info
LogLevel parse_log_level(const std::string& s);

// Which way bytes crossed the manager socket
enum class WireDirection { kSent, kReceived };

// One size-rotated file: path, path.1 ... path.N
class LogSink {
public:
    struct Options {
        std::string path;
        size_t   max_bytes   = 50 * 1024 * 1024;
        int      max_files   = 10;
        LogLevel min_level   = LogLevel::kTrace;
        bool     echo_stderr = false;
    };

    explicit LogSink(Options options);
    ~LogSink();

    void write(LogLevel level, const char* data, size_t len);
    void flush();

    size_t current_size() const;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

private:
    void open_locked();
    void rotate_locked();
    std::string numbered(int n) const;

    Options opts_;
    mutable std::mutex mu_;
    FILE*  fp_    = nullptr;
    size_t bytes_ = 0;
};

struct LoggerOptions {
    std::string directory;
    std::string base_name      = "asterisk_live";
    LogLevel    console_level  = LogLevel::kWarn;
    size_t      max_file_bytes = 50 * 1024 * 1024;
    int         max_files      = 10;
    bool        ami_trace      = false;   // Also open <base>_ami.log
};

// Process-wide logger. Until configure() runs everything goes to stderr.
// After that:
//   <base>.log        INFO+ (echoed to stderr when console level allows)
//   <base>_debug.log  everything
//   <base>_error.log  ERROR+, echoed to stderr
//   <base>_slow.log   slow dispatch/snapshot reports (LOG_SLOW)
//   <base>_ami.log    raw manager traffic, secrets masked (LOG_AMI_WIRE)
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    void configure(const LoggerOptions& options);

    void log(LogLevel level, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));

    void log_slow(const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 4, 5)));

    // Dumps one socket read/write to the wire trace. No-op unless enabled.
    void log_wire(const std::string& connection_id, WireDirection dir,
                  const char* data, size_t len);

    bool wire_trace_enabled() const { return wire_enabled_.load(std::memory_order_acquire); }

    void flush_all();

    // Replaces the value of Secret: and Key: lines with "********"
    static std::string mask_credentials(const std::string& raw);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    size_t format_line(char* buf, size_t cap, const char* tag,
                       const char* file, int line, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::atomic<bool> configured_{false};
    std::atomic<bool> wire_enabled_{false};

    std::mutex configure_mu_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    std::unique_ptr<LogSink> slow_sink_;
    std::unique_ptr<LogSink> wire_sink_;
};

#define LOG_TRACE(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kTrace, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kDebug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kInfo, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kWarn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kError, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) \
    asterisk_live::Logger::instance().log(asterisk_live::LogLevel::kFatal, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_SLOW(fmt, ...) \
    asterisk_live::Logger::instance().log_slow(__FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_AMI_WIRE(conn_id, dir, data, len) \
    do { \
        if (asterisk_live::Logger::instance().wire_trace_enabled()) \
            asterisk_live::Logger::instance().log_wire(conn_id, dir, data, len); \
    } while (0)

} // namespace asterisk_live
#endif // COMMON_LOGGER_H

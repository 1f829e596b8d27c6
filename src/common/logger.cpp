// =============================================================================
// FILE: src/common/logger.cpp
// =============================================================================
#include "common/logger.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

namespace asterisk_live {

LogLevel parse_log_level(const std::string& s) {
    static const struct { const char* name; LogLevel level; } kNames[] = {
        {"trace", LogLevel::kTrace}, {"debug", LogLevel::kDebug},
        {"info",  LogLevel::kInfo},  {"warn",  LogLevel::kWarn},
        {"warning", LogLevel::kWarn}, {"error", LogLevel::kError},
        {"fatal", LogLevel::kFatal},
    };
    for (const auto& n : kNames)
        if (strcasecmp(s.c_str(), n.name) == 0) return n.level;
    return LogLevel::kInfo;
}

namespace {

bool is_console(FILE* fp) { return fp == stderr || fp == stdout; }

void timestamp(char* out, size_t cap) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                  now.time_since_epoch()).count() % 1000);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    snprintf(out, cap, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms);
}

bool starts_with_key(const std::string& line, const char* key) {
    size_t n = strlen(key);
    return line.size() > n && strncasecmp(line.c_str(), key, n) == 0 && line[n] == ':';
}

} // namespace

// -----------------------------------------------------------------------------
// LogSink
// -----------------------------------------------------------------------------

LogSink::LogSink(Options options) : opts_(std::move(options)) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!opts_.path.empty()) open_locked();
}

LogSink::~LogSink() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_ && !is_console(fp_)) fclose(fp_);
    fp_ = nullptr;
}

void LogSink::open_locked() {
    fp_ = fopen(opts_.path.c_str(), "a");
    if (!fp_) {
        fprintf(stderr, "LOGGER: cannot open '%s' (%s), using stderr\n",
                opts_.path.c_str(), strerror(errno));
        fp_ = stderr;
        bytes_ = 0;
        return;
    }
    struct stat st;
    bytes_ = (fstat(fileno(fp_), &st) == 0) ? static_cast<size_t>(st.st_size) : 0;
}

std::string LogSink::numbered(int n) const {
    return opts_.path + "." + std::to_string(n);
}

void LogSink::rotate_locked() {
    if (!fp_ || is_console(fp_)) return;
    fclose(fp_);
    fp_ = nullptr;

    if (opts_.max_files > 0) {
        remove(numbered(opts_.max_files).c_str());
        for (int n = opts_.max_files - 1; n >= 1; --n)
            rename(numbered(n).c_str(), numbered(n + 1).c_str());
        rename(opts_.path.c_str(), numbered(1).c_str());
    } else {
        remove(opts_.path.c_str());
    }
    open_locked();
}

void LogSink::write(LogLevel level, const char* data, size_t len) {
    if (level < opts_.min_level) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (!fp_) return;
    if (opts_.max_bytes > 0 && bytes_ >= opts_.max_bytes) {
        rotate_locked();
        if (!fp_) return;
    }

    bytes_ += fwrite(data, 1, len, fp_);
    if (opts_.echo_stderr && !is_console(fp_)) fwrite(data, 1, len, stderr);
    if (level >= LogLevel::kWarn) fflush(fp_);
}

void LogSink::flush() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fp_) fflush(fp_);
}

size_t LogSink::current_size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return bytes_;
}

// -----------------------------------------------------------------------------
// Logger
// -----------------------------------------------------------------------------

Logger::Logger() : level_(LogLevel::kInfo) {}

Logger::~Logger() { flush_all(); }

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LoggerOptions& o) {
    std::lock_guard<std::mutex> lk(configure_mu_);

    configured_.store(false, std::memory_order_release);
    wire_enabled_.store(false, std::memory_order_release);
    sinks_.clear();
    slow_sink_.reset();
    wire_sink_.reset();

    if (!o.directory.empty()) mkdir(o.directory.c_str(), 0755);
    const std::string base = o.directory.empty() ? o.base_name : o.directory + "/" + o.base_name;

    auto sink = [&](const std::string& suffix, LogLevel min, int files, bool echo) {
        LogSink::Options so;
        so.path = base + suffix;
        so.max_bytes = o.max_file_bytes;
        so.max_files = files;
        so.min_level = min;
        so.echo_stderr = echo;
        return std::make_unique<LogSink>(so);
    };

    sinks_.push_back(sink(".log", LogLevel::kInfo, o.max_files,
                          o.console_level <= LogLevel::kInfo));
    sinks_.push_back(sink("_debug.log", LogLevel::kTrace, o.max_files / 2, false));
    sinks_.push_back(sink("_error.log", LogLevel::kError, o.max_files, true));
    slow_sink_ = sink("_slow.log", LogLevel::kTrace, o.max_files, false);
    if (o.ami_trace) wire_sink_ = sink("_ami.log", LogLevel::kTrace, o.max_files, false);

    configured_.store(true, std::memory_order_release);
    wire_enabled_.store(wire_sink_ != nullptr, std::memory_order_release);

    fprintf(stderr, "Logger configured: base=%s max_size=%zu max_files=%d ami_trace=%s\n",
            base.c_str(), o.max_file_bytes, o.max_files, o.ami_trace ? "on" : "off");
}

size_t Logger::format_line(char* buf, size_t cap, const char* tag,
                           const char* file, int line, const char* fmt, va_list args) {
    char ts[32];
    timestamp(ts, sizeof(ts));

    const char* base = strrchr(file, '/');
    base = base ? base + 1 : file;

    int head = snprintf(buf, cap, "%s [%s] [tid:%lu] [%s:%d] ", ts, tag,
                        static_cast<unsigned long>(pthread_self()), base, line);
    if (head < 0 || static_cast<size_t>(head) >= cap) return 0;

    int body = vsnprintf(buf + head, cap - static_cast<size_t>(head), fmt, args);
    size_t total = static_cast<size_t>(head) + (body > 0 ? static_cast<size_t>(body) : 0);
    if (total > cap - 2) total = cap - 2;

    buf[total++] = '\n';
    buf[total] = '\0';
    return total;
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < level_.load(std::memory_order_relaxed)) return;

    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_line(buf, sizeof(buf), log_level_name(level), file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        if (level >= LogLevel::kWarn) fflush(stderr);
        return;
    }

    for (auto& s : sinks_) s->write(level, buf, len);
    if (level == LogLevel::kFatal) flush_all();
}

void Logger::log_slow(const char* file, int line, const char* fmt, ...) {
    char buf[4096];
    va_list args;
    va_start(args, fmt);
    size_t len = format_line(buf, sizeof(buf), "SLOW", file, line, fmt, args);
    va_end(args);
    if (len == 0) return;

    if (!configured_.load(std::memory_order_acquire)) {
        fwrite(buf, 1, len, stderr);
        return;
    }

    if (slow_sink_) slow_sink_->write(LogLevel::kWarn, buf, len);
    for (auto& s : sinks_) s->write(LogLevel::kWarn, buf, len);
}

void Logger::log_wire(const std::string& connection_id, WireDirection dir,
                      const char* data, size_t len) {
    if (!wire_enabled_.load(std::memory_order_acquire) || !wire_sink_) return;

    char ts[32];
    timestamp(ts, sizeof(ts));

    std::string out;
    out.reserve(len + 64);
    out += ts;
    out += dir == WireDirection::kSent ? " >> [" : " << [";
    out += connection_id;
    out += "] ";
    out += std::to_string(len);
    out += " bytes\n";
    out += mask_credentials(std::string(data, len));
    if (out.back() != '\n') out += '\n';

    wire_sink_->write(LogLevel::kTrace, out.data(), out.size());
}

void Logger::flush_all() {
    for (auto& s : sinks_) s->flush();
    if (slow_sink_) slow_sink_->flush();
    if (wire_sink_) wire_sink_->flush();
}

std::string Logger::mask_credentials(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    size_t pos = 0;
    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        size_t end = (eol == std::string::npos) ? raw.size() : eol + 1;
        std::string line = raw.substr(pos, end - pos);

        if (starts_with_key(line, "Secret") || starts_with_key(line, "Key")) {
            size_t colon = line.find(':');
            bool crlf = line.size() >= 2 && line.compare(line.size() - 2, 2, "\r\n") == 0;
            bool lf = !crlf && !line.empty() && line.back() == '\n';
            out += line.substr(0, colon + 1);
            out += " ********";
            if (crlf) out += "\r\n";
            else if (lf) out += '\n';
        } else {
            out += line;
        }
        pos = end;
    }
    return out;
}

} // namespace asterisk_live

#ifndef PROPCURVES_LOG_HXX
#define PROPCURVES_LOG_HXX

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

// Severity levels (ascending verbosity).
enum class LogLevel {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3
};

// Process-wide logger, printf-style.
// - Writes to stderr; optionally mirrors into a file (opened in append mode).
// - The initial level comes from PROPCURVES_LOG_LEVEL (error|warn|info|debug),
//   default warn.
// - Safe for concurrent writers.
class Logger {
public:
    static Logger& instance();
    ~Logger();

    void setLevel(LogLevel lvl);
    LogLevel level() const;
    bool enabled(LogLevel lvl) const;

    // Empty path closes the file and logs to stderr only.
    // Returns false if the file cannot be opened.
    bool setFile(const std::string& path);

    void setMirrorToStderr(bool on);

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

    // Parses "error", "warn", "info", "debug" (case-insensitive). Returns false
    // and leaves `out` untouched for anything else.
    static bool parseLevel(const std::string& text, LogLevel& out);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* levelTag(LogLevel lvl);

    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Warn)};
    FILE* file_{nullptr};
    bool mirror_{true};
};

#define PROPCURVES_LOG_ERROR(fmt, ...) ::Logger::instance().write(::LogLevel::Error, fmt, ##__VA_ARGS__)
#define PROPCURVES_LOG_WARN(fmt, ...)  ::Logger::instance().write(::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define PROPCURVES_LOG_INFO(fmt, ...)  ::Logger::instance().write(::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define PROPCURVES_LOG_DEBUG(fmt, ...) ::Logger::instance().write(::LogLevel::Debug, fmt, ##__VA_ARGS__)

#endif // PROPCURVES_LOG_HXX

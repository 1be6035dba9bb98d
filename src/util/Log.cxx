#include "Log.hxx"

#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>

namespace {
static inline std::string makeTimestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}
}

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::Logger() {
    const char* env = std::getenv("PROPCURVES_LOG_LEVEL");
    LogLevel lvl;
    if (env && parseLevel(env, lvl)) setLevel(lvl);
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel lvl) const {
    return static_cast<int>(lvl) <= level_.load(std::memory_order_relaxed);
}

bool Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
    if (path.empty()) return true;
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
}

void Logger::setMirrorToStderr(bool on) {
    std::lock_guard<std::mutex> lock(mtx_);
    mirror_ = on;
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (!enabled(lvl)) return;
    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (!enabled(lvl)) return;

    std::array<char, 1024> msg{};
    std::vsnprintf(msg.data(), msg.size(), fmt, ap);
    const std::string stamp = makeTimestamp();

    std::lock_guard<std::mutex> lock(mtx_);
    if (mirror_) {
        std::fprintf(stderr, "%s [%s] %s\n", stamp.c_str(), levelTag(lvl), msg.data());
    }
    if (file_) {
        std::fprintf(file_, "%s [%s] %s\n", stamp.c_str(), levelTag(lvl), msg.data());
        std::fflush(file_);
    }
}

bool Logger::parseLevel(const std::string& text, LogLevel& out) {
    std::string t;
    for (char c : text) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "error") { out = LogLevel::Error; return true; }
    if (t == "warn" || t == "warning") { out = LogLevel::Warn; return true; }
    if (t == "info") { out = LogLevel::Info; return true; }
    if (t == "debug") { out = LogLevel::Debug; return true; }
    return false;
}

const char* Logger::levelTag(LogLevel lvl) {
    switch (lvl) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

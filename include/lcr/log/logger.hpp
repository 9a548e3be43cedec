#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Human-readable severity names
[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal" (lowercase).
// Returns false and leaves `out` untouched on unknown input.
[[nodiscard]]
inline bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "trace")      { out = Level::Trace; return true; }
    if (text == "debug")      { out = Level::Debug; return true; }
    if (text == "info")       { out = Level::Info;  return true; }
    if (text == "warn")       { out = Level::Warn;  return true; }
    if (text == "error")      { out = Level::Error; return true; }
    if (text == "fatal")      { out = Level::Fatal; return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
// The sampler thread, the scrape thread and main() all log through the same
// instance. Level checks are lock-free; formatting and the write are serialized.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    [[nodiscard]]
    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable ANSI colors (disable when output is not a terminal)
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = (os != nullptr) ? os : &std::cout;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        const std::string ts = timestamp();
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << ts << " [" << to_string(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << '\n';
        os.flush();
    }

private:
    Logger()
        : out_(&std::cout)
    {}

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Wall-clock timestamp with millisecond precision (log display only)
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_enabled_{true};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl)
        : lvl_(lvl)
        , active_(Logger::instance().enabled(lvl))
    {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        if (active_) ss_ << v;
        return *this;
    }

    ~LogStream() {
        if (active_) Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    bool active_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
#define HCW_LOG_LEVEL(lvl) ::lcr::log::LogStream((lvl))

#define HCW_TRACE(msg)  HCW_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define HCW_DEBUG(msg)  HCW_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define HCW_INFO(msg)   HCW_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define HCW_WARN(msg)   HCW_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define HCW_ERROR(msg)  HCW_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define HCW_FATAL(msg)  HCW_LOG_LEVEL(::lcr::log::Level::Fatal) << msg

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Levels
// ---------------------------------------------------------
enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

namespace detail {

inline constexpr std::array<std::string_view, 7> level_names{
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"
};

inline constexpr std::array<const char*, 7> level_colors{
    "\033[37m",    // trace: light gray
    "\033[36m",    // debug: cyan
    "\033[32m",    // info: green
    "\033[33m",    // warn: yellow
    "\033[31m",    // error: red
    "\033[1;31m",  // fatal: bold red
    "\033[0m"
};

inline constexpr const char* color_reset = "\033[0m";

} // namespace detail

[[nodiscard]] inline constexpr std::string_view to_string(Level lvl) noexcept {
    const auto i = static_cast<std::size_t>(lvl);
    return i < detail::level_names.size() ? detail::level_names[i] : std::string_view{"?????"};
}

// Lower-case names as accepted on command lines and in config files.
// Unknown names fall back to Info.
[[nodiscard]] inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return Level::Info;
}


// ---------------------------------------------------------
// Process-wide logger
// ---------------------------------------------------------
//
// One line per record:
//
//     2026-01-01 12:00:00.123 [WARN] [FRAME] Reserved bit set ...
//
// Writes are serialized; level and color switches are plain stores and are
// meant to be set once at startup.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }
    [[nodiscard]] Level level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level_;
    }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Sink must outlive the logger or be replaced before destruction.
    // Returns the previous sink.
    std::ostream* set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream* previous = out_;
        out_ = os != nullptr ? os : &std::cerr;
        return previous;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const std::string stamp = timestamp();

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& os = *out_;
        if (color_enabled_) {
            os << detail::level_colors[static_cast<std::size_t>(lvl)];
        }
        os << stamp << " [" << to_string(lvl) << "] " << msg;
        if (color_enabled_) {
            os << detail::color_reset;
        }
        os << '\n';
        os.flush();
    }

private:
    Logger() = default;

    // Local time, millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_ = &std::cerr;
    Level level_ = Level::Info;
    bool color_enabled_ = false;
    std::mutex mutex_;
};


// ---------------------------------------------------------
// One record: collects << operands, emits on destruction
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Logging macros
// ---------------------------------------------------------
// Operands of << are not evaluated when the level is disabled.
#define GW_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define GW_TRACE(msg)  GW_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define GW_DEBUG(msg)  GW_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define GW_INFO(msg)   GW_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define GW_WARN(msg)   GW_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define GW_ERROR(msg)  GW_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define GW_FATAL(msg)  GW_LOG_LEVEL(::lcr::log::Level::Fatal) << msg

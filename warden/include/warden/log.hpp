#pragma once
// Logging: component-tagged lines on stderr
//
//   [14:02:11.532][safety] Product vetoed by rule-based gate: Paraben Cream
//
// Debug lines are only written in verbose mode (--verbose or WARDEN_VERBOSE=1).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace warden::log {

enum class Level { Debug, Info, Warn, Error };

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

inline const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug: return "";
        case Level::Info: return "";
        case Level::Warn: return "WARNING: ";
        case Level::Error: return "ERROR: ";
    }
    return "";
}

inline void write(Level level, const char* component, const std::string& message) {
    if (level == Level::Debug && !verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    // One writer at a time so lines from parallel turns don't interleave
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << component << "] "
              << level_tag(level) << message << "\n";
}

inline void vwrite(Level level, const char* component, const char* fmt, va_list args) {
    if (level == Level::Debug && !verbose()) return;

    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    write(level, component, buf);
}

inline void debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Debug, component, fmt, args);
    va_end(args);
}

inline void info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Info, component, fmt, args);
    va_end(args);
}

inline void warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Warn, component, fmt, args);
    va_end(args);
}

inline void error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace warden::log

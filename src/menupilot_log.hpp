// =============================================================================
// MenuPilot - ログ
// =============================================================================
// レベル絞り込み付きの printf 形式ロガー。stderr と（開いていれば）ログファイル
// の両方に 1 行ずつ出力する。
//   MPLOG_INFO("engine", "state=%s repeat=%d", id.c_str(), n);
// 出力: 12:34:56.789 [INFO ] [engine] (T4711) state=start_menu repeat=0
// =============================================================================
#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace menupilot::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

namespace detail {

struct Sink {
    std::atomic<Level> min_level{Level::Info};
    std::mutex mutex;
    FILE* file = nullptr;
};

inline Sink& sink() {
    static Sink s;
    return s;
}

inline void timestamp(char* out, size_t n) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    int ms = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()).count() % 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    std::snprintf(out, n, "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms);
}

} // namespace detail

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

inline void setLogLevel(Level l) { detail::sink().min_level.store(l); }
inline Level logLevel() { return detail::sink().min_level.load(std::memory_order_relaxed); }

// 設定ファイル / CLI の表記 (DEBUG, INFO, WARNING, ERROR, CRITICAL)。大文字小文字は問わない
inline std::optional<Level> parseLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    if (name == "TRACE")                        return Level::Trace;
    if (name == "DEBUG")                        return Level::Debug;
    if (name == "INFO")                         return Level::Info;
    if (name == "WARNING" || name == "WARN")    return Level::Warn;
    if (name == "ERROR")                        return Level::Error;
    if (name == "CRITICAL" || name == "FATAL")  return Level::Fatal;
    return std::nullopt;
}

// 上書きモード（前回実行のログは残さない）
inline bool openLogFile(const char* path) {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) std::fclose(s.file);
    s.file = std::fopen(path, "w");
    return s.file != nullptr;
}

inline void closeLogFile() {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) {
        std::fclose(s.file);
        s.file = nullptr;
    }
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    auto& s = detail::sink();
    if (level < s.min_level.load(std::memory_order_relaxed)) return;

    char line[2304];
    detail::timestamp(line, 16);
    unsigned long tid = (unsigned long)(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
    int head = std::snprintf(line + 12, sizeof(line) - 12, " [%s] [%s] (T%lu) ", levelStr(level), tag, tid);
    size_t used = 12 + (head > 0 ? std::min((size_t)head, sizeof(line) - 13) : 0);

    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line + used, sizeof(line) - used, fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(s.mutex);
    std::fprintf(stderr, "%s\n", line);
    if (s.file) {
        std::fprintf(s.file, "%s\n", line);
        std::fflush(s.file);
    }
}

} // namespace menupilot::log

#define MPLOG_TRACE(tag, fmt, ...) menupilot::log::write(menupilot::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define MPLOG_DEBUG(tag, fmt, ...) menupilot::log::write(menupilot::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define MPLOG_INFO(tag, fmt, ...)  menupilot::log::write(menupilot::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define MPLOG_WARN(tag, fmt, ...)  menupilot::log::write(menupilot::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define MPLOG_ERROR(tag, fmt, ...) menupilot::log::write(menupilot::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define MPLOG_FATAL(tag, fmt, ...) menupilot::log::write(menupilot::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)

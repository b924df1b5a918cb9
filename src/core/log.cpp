#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <memory>
#include <mutex>
#include <cctype>

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kWarning: return "WARNING";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kNone:    return "NONE";
    }
    return "INFO";
}

LogLevel log_level_from_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:  return LogLevel::kNone;
    case 1:
    case 2:  return LogLevel::kError;
    case 3:  return LogLevel::kWarning;
    case 4:  return LogLevel::kInfo;
    default: return verbosity < 0 ? LogLevel::kNone : LogLevel::kDebug;
    }
}

LogLevel log_level_from_name(const std::string& name) {
    std::string n;
    for (char c : name) n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n == "debug") return LogLevel::kDebug;
    if (n == "warning" || n == "warn") return LogLevel::kWarning;
    if (n == "error" || n == "critical") return LogLevel::kError;
    if (n == "none" || n == "off") return LogLevel::kNone;
    return LogLevel::kInfo;
}

std::string default_log_path() {
    return (platform::temp_dir() / "termhop_debug.log").string();
}

LogSink file_log_sink(const std::string& path, LogLevel min_level) {
    // Several connections may share one file; serialize the appends.
    auto mtx = std::make_shared<std::mutex>();
    return [path, min_level, mtx](const LogEvent& ev) {
        if (static_cast<int>(ev.level) < static_cast<int>(min_level)) return;
        if (min_level == LogLevel::kNone) return;

        std::lock_guard<std::mutex> lock(*mtx);
        std::ofstream out(path, std::ios::app);
        if (!out) return;

        std::string where = ev.host;
        if (ev.hop > 0) where = fmt::format("{}#{}", ev.host, ev.hop);
        out << fmt::format("[{}] {:>7} [{}] {}: {}\n",
                           now_clock_ms(), log_level_name(ev.level),
                           where, ev.event, ev.message);
    };
}

LogSink null_log_sink() {
    return [](const LogEvent&) {};
}

void Logger::log(LogLevel level, const std::string& event,
                 const std::string& message, int hop) const {
    if (!sink_) return;
    LogEvent ev;
    ev.level = level;
    ev.event = event;
    ev.hop = hop;
    ev.host = host_;
    ev.message = message;
    sink_(ev);
}

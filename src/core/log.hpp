#pragma once

#include <string>
#include <functional>
#include <fmt/format.h>

enum class LogLevel {
    kDebug = 10,
    kInfo = 20,
    kWarning = 30,
    kError = 40,
    kNone = 60,
};

const char* log_level_name(LogLevel level);

// CLI verbosity 0..5 -> level (0 = nothing, 5 = debug)
LogLevel log_level_from_verbosity(int verbosity);

// "debug", "info", ... case-insensitive; unknown names give kInfo.
LogLevel log_level_from_name(const std::string& name);

// One progress event emitted by the connection core.
struct LogEvent {
    LogLevel level = LogLevel::kInfo;
    std::string event;     // connect, connect-success, command-result, disconnect, fsm, ...
    int hop = 0;
    std::string host;
    std::string message;
};

using LogSink = std::function<void(const LogEvent&)>;

// Appends "[HH:MM:SS.mmm] LEVEL [host] event: message" lines to a file.
LogSink file_log_sink(const std::string& path, LogLevel min_level = LogLevel::kDebug);

LogSink null_log_sink();

// Default debug log location: <tmp>/termhop_debug.log
std::string default_log_path();

// Thin wrapper so call sites read like `log_.info("connect", "...")`.
class Logger {
public:
    Logger() = default;
    explicit Logger(LogSink sink, std::string host = "")
        : sink_(std::move(sink)), host_(std::move(host)) {}

    const std::string& host() const { return host_; }

    void log(LogLevel level, const std::string& event, const std::string& message, int hop = 0) const;

    void debug(const std::string& event, const std::string& message, int hop = 0) const {
        log(LogLevel::kDebug, event, message, hop);
    }
    void info(const std::string& event, const std::string& message, int hop = 0) const {
        log(LogLevel::kInfo, event, message, hop);
    }
    void warning(const std::string& event, const std::string& message, int hop = 0) const {
        log(LogLevel::kWarning, event, message, hop);
    }
    void error(const std::string& event, const std::string& message, int hop = 0) const {
        log(LogLevel::kError, event, message, hop);
    }

private:
    LogSink sink_;
    std::string host_;
};

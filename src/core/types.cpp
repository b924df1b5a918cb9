#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kConnection:               return "ConnectionError";
    case ErrorKind::kConnectionAuthentication: return "ConnectionAuthenticationError";
    case ErrorKind::kConnectionTimeout:        return "ConnectionTimeoutError";
    case ErrorKind::kCommand:                  return "CommandError";
    case ErrorKind::kCommandSyntax:            return "CommandSyntaxError";
    case ErrorKind::kCommandTimeout:           return "CommandTimeoutError";
    case ErrorKind::kInvalidHopInfo:           return "InvalidHopInfoError";
    }
    return "Error";
}

std::string Error::describe() const {
    std::string text = message.empty() ? error_kind_name(kind) : message;
    if (!command.empty()) {
        text = fmt::format("{}: '{}'", text, command);
    }
    if (!host.empty()) {
        text = fmt::format("{}: {}", host, text);
    }
    if (hop > 0) {
        text = fmt::format("{} (hop {})", text, hop);
    }
    return text;
}

Error make_error(ErrorKind kind, const std::string& message,
                 const std::string& host, int hop) {
    Error e;
    e.kind = kind;
    e.message = message;
    e.host = host;
    e.hop = hop;
    return e;
}

Error make_command_error(ErrorKind kind, const std::string& message,
                         const std::string& command, const std::string& host) {
    Error e;
    e.kind = kind;
    e.message = message;
    e.command = command;
    e.host = host;
    return e;
}

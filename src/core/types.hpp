#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>

// ── Errors ──────────────────────────────────────────────────

// Flat error taxonomy. Subtype relations are answered by the predicates
// below instead of an inheritance chain.
enum class ErrorKind {
    kConnection,                 // transport / negotiation failure
    kConnectionAuthentication,   // credentials rejected or retry budget spent
    kConnectionTimeout,          // nothing expected matched during connect
    kCommand,                    // generic command execution failure
    kCommandSyntax,              // device rejected the command
    kCommandTimeout,             // no prompt after the command
    kInvalidHopInfo,             // malformed connection target
};

inline bool is_connection_error(ErrorKind kind) {
    return kind == ErrorKind::kConnection ||
           kind == ErrorKind::kConnectionAuthentication ||
           kind == ErrorKind::kConnectionTimeout;
}

inline bool is_command_error(ErrorKind kind) {
    return kind == ErrorKind::kCommand ||
           kind == ErrorKind::kCommandSyntax ||
           kind == ErrorKind::kCommandTimeout;
}

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::kConnection;
    std::string message;
    int hop = 0;              // 1-based failing hop, 0 when not hop related
    std::string host;
    std::string command;

    // "<host>: <message>: '<command>'" with absent parts omitted
    std::string describe() const;
};

Error make_error(ErrorKind kind, const std::string& message,
                 const std::string& host = "", int hop = 0);

Error make_command_error(ErrorKind kind, const std::string& message,
                         const std::string& command, const std::string& host = "");

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Command results ─────────────────────────────────────────

enum class CommandStatus {
    kSuccess,
    kSyntaxError,
    kTimeout,
};

struct CommandResult {
    std::string output;
    CommandStatus status = CommandStatus::kSuccess;

    bool ok() const { return status == CommandStatus::kSuccess; }
};

// ── Device identity ─────────────────────────────────────────

// Fact sheet filled in by discovery. Replaced wholesale on every
// successful discovery, never merged.
struct DeviceInfo {
    std::string hostname;
    std::string family;
    std::string platform;        // hardware model, e.g. ASR-9006
    std::string os_type;         // IOS, XE, XR, eXR, NX-OS, Calvados
    std::string os_version;
    std::string product_id;
    std::string vendor_id;
    std::string serial_number;
    std::string description;
    std::string prompt;
    std::string mode;            // global, config, admin
    std::string profile;         // name of the matched platform profile
    bool is_console = false;
};


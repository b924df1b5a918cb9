#pragma once

#include <cstddef>

// ── SSH / telnet invocation ─────────────────────────────────
// Options for every ssh hop. Known-hosts checking is off because lab
// devices are re-imaged and change keys all the time.
constexpr const char* SSH_OPTS = "-o UserKnownHostsFile=/dev/null -o StrictHostKeyChecking=no";
constexpr const char* SSH_PROGRAM = "ssh";
constexpr const char* TELNET_PROGRAM = "telnet";
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DEFAULT_TELNET_PORT        = 23;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // Per login step
constexpr int COMMAND_TIMEOUT_SECS       = 60;    // Waiting for the prompt after a command
constexpr int DISCOVERY_TIMEOUT_SECS     = 120;   // Whole chain, all hops
constexpr int RELOAD_TIMEOUT_SECS        = 300;   // Waiting for the device to drop the session
constexpr int EXIT_TIMEOUT_SECS          = 5;     // Waiting for a hop to go away on disconnect
constexpr int ENABLE_TIMEOUT_SECS        = 10;

// ── Retry counts ────────────────────────────────────────────
constexpr int PASSWORD_RETRIES           = 3;     // Password prompts answered per hop
constexpr int LOGIN_NUDGES               = 2;     // Extra newlines on a quiet line
constexpr int RECONNECT_MAX_ATTEMPTS     = 3;
constexpr int RECONNECT_BACKOFF_MS       = 1000;  // Doubles after every attempt
constexpr int FSM_MAX_TRANSITIONS        = 50;

// ── Terminal ────────────────────────────────────────────────
constexpr int TERMINAL_ROWS              = 24;
constexpr int TERMINAL_COLS              = 160;
constexpr int READ_BUF_SIZE              = 4096;
constexpr size_t EXPECT_LOOKBACK         = 1024;  // Bytes re-searched when new output arrives
constexpr const char* TERMINAL_TYPE      = "vt100";   // no colour escapes

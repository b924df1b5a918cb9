#pragma once

#include <string>

namespace platform {

// True when stdin is an interactive terminal.
bool stdin_is_tty();

// RAII guard that turns off echo on stdin for the lifetime of the guard.
// Canonical (line) mode stays on so the user can still edit and press enter.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Print `prompt` to stderr and read one line from stdin with echo off.
// Returns an empty string on EOF.
std::string read_secret(const std::string& prompt);

} // namespace platform

#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <iostream>

namespace platform {

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    if (!stdin_is_tty()) return;
    impl_ = new Impl;
    tcgetattr(STDIN_FILENO, &impl_->old_term);
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── read_secret ──────────────────────────────────────────────

std::string read_secret(const std::string& prompt) {
    std::cerr << prompt << std::flush;
    std::string line;
    {
        NoEchoGuard guard;
        if (!std::getline(std::cin, line)) line.clear();
    }
    std::cerr << "\n";
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

} // namespace platform

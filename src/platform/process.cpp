#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <sys/ioctl.h>
#include <signal.h>
#include <fcntl.h>
#include <termios.h>
#include <pty.h>
#include <cstdlib>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::reap(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reap(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) reap(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reap(status);
            return exit_code_;
        }
        if (ret < 0) return -1;
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    // ssh and telnet exit cleanly on hangup
    kill(pid_, SIGHUP);
    if (wait(500) >= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    if (wait(2000) >= 0 || reaped_) return;
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) reap(status);
}

// ── spawn_pty ────────────────────────────────────────────────

PtyChild spawn_pty(const std::string& program,
                   const std::vector<std::string>& args,
                   int rows, int cols,
                   const std::string& term) {
    PtyChild child;

    struct winsize ws;
    ws.ws_row = static_cast<unsigned short>(rows);
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_xpixel = 0;
    ws.ws_ypixel = 0;

    int master = -1;
    pid_t pid = forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) return child;  // pty or fork failed

    if (pid == 0) {
        // Child process
        setenv("TERM", term.c_str(), 1);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    int flags = fcntl(master, F_GETFL, 0);
    fcntl(master, F_SETFL, flags | O_NONBLOCK);

    child.process.pid_ = pid;
    child.master_fd = master;
    return child;
}

} // namespace platform

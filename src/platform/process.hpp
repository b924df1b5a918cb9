#pragma once

#include <string>
#include <vector>

namespace platform {

struct PtyChild;

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGHUP, SIGTERM, then SIGKILL).
    void terminate();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void reap(int status);

    friend PtyChild spawn_pty(const std::string& program,
                              const std::vector<std::string>& args,
                              int rows, int cols,
                              const std::string& term);
};

// A child attached to the slave side of a pseudo terminal. The master fd is
// non-blocking and owned by the caller.
struct PtyChild {
    ProcessHandle process;
    int master_fd = -1;

    bool valid() const { return process.valid() && master_fd >= 0; }
};

// Spawn `program args...` on a fresh pty of the given size with TERM set.
// Returns an invalid PtyChild when the pty or fork fails.
PtyChild spawn_pty(const std::string& program,
                   const std::vector<std::string>& args,
                   int rows, int cols,
                   const std::string& term);

} // namespace platform

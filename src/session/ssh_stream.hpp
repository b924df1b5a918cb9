#pragma once

#include "stream.hpp"
#include <mutex>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Supplies the login password of the first hop to the in-process client.
using PasswordLookup = std::function<Result<std::string>(const Hop& hop)>;

// In-process ssh client (libssh2). Authenticates during open(), then
// requests a pty and a shell so the remote side looks like any terminal.
class SshStream : public Stream {
public:
    ~SshStream() override;

    static Result<StreamPtr> open(const Hop& hop, const std::string& password,
                                  int timeout_ms);

    bool write(const std::string& data) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    bool alive() override;
    void close() override;
    bool authenticated() const override { return true; }
    std::string describe() const override { return description_; }

private:
    SshStream() = default;

    Result<void> handshake(int timeout_ms);
    Result<void> userauth(const std::string& user, const std::string& password);
    Result<void> open_shell();

    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    int sock_ = -1;
    bool eof_ = false;
    std::string description_;
    std::mutex io_mutex_;
};

// Factory opening the first hop with libssh2. Only ssh hops are supported;
// telnet hops fall back to the local client.
StreamFactory ssh_stream_factory(PasswordLookup lookup, int timeout_ms);

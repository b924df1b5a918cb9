#include "ssh_stream.hpp"
#include "pty_stream.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <cstdlib>
#include <algorithm>

namespace {

struct KbdAuthData {
    std::string password;
};

// Answer every keyboard-interactive prompt with the password.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

Result<StreamPtr> fail(ErrorKind kind, const std::string& message, const Hop& hop) {
    return Result<StreamPtr>::Err(make_error(kind, message, hop.host, 1));
}

} // namespace

SshStream::~SshStream() {
    close();
}

Result<StreamPtr> SshStream::open(const Hop& hop, const std::string& password, int timeout_ms) {
    std::shared_ptr<SshStream> stream(new SshStream());
    stream->description_ = "libssh2 " + hop.display();

    if (libssh2_init(0) != 0) {
        return fail(ErrorKind::kConnection, "Failed to initialize libssh2", hop);
    }

    std::string error;
    stream->sock_ = platform::connect_tcp(hop.host, hop.port, timeout_ms, error);
    if (stream->sock_ == TERMHOP_INVALID_SOCKET) {
        ErrorKind kind = error.find("timed out") != std::string::npos
            ? ErrorKind::kConnectionTimeout : ErrorKind::kConnection;
        return fail(kind, "Unable to connect: " + error, hop);
    }

    auto hs = stream->handshake(timeout_ms);
    if (hs.is_err()) return fail(hs.error.kind, hs.error.message, hop);

    auto auth = stream->userauth(hop.username.value_or(""), password);
    if (auth.is_err()) return fail(auth.error.kind, auth.error.message, hop);

    auto shell = stream->open_shell();
    if (shell.is_err()) return fail(shell.error.kind, shell.error.message, hop);

    return Result<StreamPtr>::Ok(stream);
}

Result<void> SshStream::handshake(int timeout_ms) {
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Failed to create SSH session"));
    }
    libssh2_session_set_blocking(session_, 0);
    libssh2_session_set_timeout(session_, timeout_ms);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::poll_socket(sock_, POLLIN | POLLOUT, 100);
    }
    if (ret != 0) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "SSH handshake failed"));
    }

    libssh2_keepalive_config(session_, 1, 30);
    return Result<void>::Ok();
}

Result<void> SshStream::userauth(const std::string& user, const std::string& password) {
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(50);
    }
    std::string methods = auth_list ? auth_list : "";
    int ret;

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{password};
        *libssh2_session_abstract(session_) = &kbd_data;
        while ((ret = libssh2_userauth_keyboard_interactive(session_, user.c_str(),
                                                            kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((ret = libssh2_userauth_password(session_, user.c_str(),
                                                password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(50);
        }
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(make_error(ErrorKind::kConnectionAuthentication,
                                        "Authentication failed (check username/password)"));
}

Result<void> SshStream::open_shell() {
    while ((channel_ = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(make_error(ErrorKind::kConnection, "Failed to open SSH channel"));
        }
        platform::sleep_ms(50);
    }

    int ret;
    while ((ret = libssh2_channel_request_pty_ex(
                channel_, TERMINAL_TYPE, static_cast<unsigned int>(std::strlen(TERMINAL_TYPE)),
                nullptr, 0, TERMINAL_COLS, TERMINAL_ROWS, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Failed to request pty"));
    }

    while ((ret = libssh2_channel_shell(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(50);
    }
    if (ret != 0) {
        return Result<void>::Err(make_error(ErrorKind::kConnection, "Failed to request shell"));
    }
    return Result<void>::Ok();
}

bool SshStream::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!channel_ || eof_) return false;
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = libssh2_channel_write(channel_, data.data() + written, data.size() - written);
        if (n == LIBSSH2_ERROR_EAGAIN) {
            platform::poll_socket(sock_, POLLOUT, 100);
            continue;
        }
        if (n < 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

ReadResult SshStream::read(std::chrono::milliseconds timeout) {
    ReadResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[READ_BUF_SIZE];

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!channel_ || eof_) {
                result.closed = true;
                return result;
            }
            ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n > 0) {
                result.data.assign(buf, static_cast<size_t>(n));
                return result;
            }
            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                eof_ = true;
                result.closed = true;
                return result;
            }
            if (libssh2_channel_eof(channel_)) {
                eof_ = true;
                result.closed = true;
                return result;
            }
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return result;
        platform::poll_socket(sock_, POLLIN, static_cast<int>(std::min<long long>(remaining.count(), 100)));
    }
}

bool SshStream::alive() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_ || !channel_ || eof_) return false;
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    return !(revents & (POLLERR | POLLHUP | POLLNVAL));
}

void SshStream::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    eof_ = true;
    if (channel_) {
        libssh2_channel_close(channel_);
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != TERMHOP_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = TERMHOP_INVALID_SOCKET;
    }
}

StreamFactory ssh_stream_factory(PasswordLookup lookup, int timeout_ms) {
    return [lookup, timeout_ms](const Hop& hop) -> Result<StreamPtr> {
        if (hop.protocol != Protocol::kSsh) {
            return PtyStream::spawn(hop.connect_argv());
        }
        auto password = lookup(hop);
        if (password.is_err()) return Result<StreamPtr>::Err(password.error);
        return SshStream::open(hop, password.value, timeout_ms);
    };
}

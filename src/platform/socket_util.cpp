#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        error = "Could not resolve hostname " + host + ": " + gai_strerror(rc);
        return TERMHOP_INVALID_SOCKET;
    }

    socket_t sock = TERMHOP_INVALID_SOCKET;
    error = "No usable address for " + host;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) continue;

        set_nonblocking(sock);
        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret == 0) break;

        if (errno == EINPROGRESS) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                error = "Connection timed out: " + host;
            } else {
                int sock_err = 0;
                socklen_t err_len = sizeof(sock_err);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
                if (sock_err == 0) break;
                error = "Connection failed: " + std::string(strerror(sock_err));
            }
        } else {
            error = "Connection failed: " + std::string(strerror(errno));
        }
        close_socket(sock);
        sock = TERMHOP_INVALID_SOCKET;
    }

    freeaddrinfo(res);
    return sock;
}

} // namespace platform

#include "pty_stream.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <sstream>

PtyStream::~PtyStream() {
    close();
}

Result<StreamPtr> PtyStream::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Result<StreamPtr>::Err(make_error(ErrorKind::kConnection, "Nothing to spawn"));
    }

    std::shared_ptr<PtyStream> stream(new PtyStream());
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    stream->child_ = platform::spawn_pty(argv[0], args, TERMINAL_ROWS, TERMINAL_COLS, TERMINAL_TYPE);
    if (!stream->child_.valid()) {
        return Result<StreamPtr>::Err(make_error(ErrorKind::kConnection,
                                                 "Unable to spawn '" + argv[0] + "'"));
    }

    std::ostringstream desc;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) desc << ' ';
        desc << argv[i];
    }
    stream->description_ = desc.str();
    return Result<StreamPtr>::Ok(stream);
}

bool PtyStream::write(const std::string& data) {
    if (child_.master_fd < 0) return false;
    size_t written = 0;
    int stalls = 0;
    while (written < data.size()) {
        ssize_t n = ::write(child_.master_fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                // Child is not draining its input; give it a moment
                if (++stalls > 200) return false;
                platform::sleep_ms(10);
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ReadResult PtyStream::read(std::chrono::milliseconds timeout) {
    ReadResult result;
    if (child_.master_fd < 0 || eof_) {
        result.closed = true;
        return result;
    }

    struct pollfd pfd;
    pfd.fd = child_.master_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret <= 0) return result;

    char buf[READ_BUF_SIZE];
    ssize_t n = ::read(child_.master_fd, buf, sizeof(buf));
    if (n > 0) {
        result.data.assign(buf, static_cast<size_t>(n));
        return result;
    }
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
        return result;
    }

    // EOF, or EIO once the child closed the slave side
    eof_ = true;
    result.closed = true;
    return result;
}

bool PtyStream::alive() {
    return !eof_ && child_.process.running();
}

void PtyStream::close() {
    if (child_.process.valid()) {
        child_.process.terminate();
    }
    if (child_.master_fd >= 0) {
        ::close(child_.master_fd);
        child_.master_fd = -1;
    }
    eof_ = true;
}

StreamFactory pty_stream_factory() {
    return [](const Hop& hop) {
        return PtyStream::spawn(hop.connect_argv());
    };
}

#include "connection_utils.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

SocketStream::SocketStream(int f, int timeoutMs)
    : fd(f), readTimeoutMs(timeoutMs) {}

SocketStream::~SocketStream() {
    close();
}

ssize_t SocketStream::read(char *buf, size_t len) {
    if (fd < 0)
        return -1;

    // タイムアウト指定があれば poll で待つ（busy-wait はしない）
    if (readTimeoutMs > 0) {
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret;
        do {
            ret = poll(&pfd, 1, readTimeoutMs);
        } while (ret < 0 && errno == EINTR);

        if (ret == 0) {
            std::ostringstream oss;
            oss << "read timeout (" << readTimeoutMs << "ms) fd=" << fd;
            logMessage(WARNING, oss.str());
            return -1;
        }
        if (ret < 0) {
            logError("SocketStream::read", std::strerror(errno));
            return -1;
        }
    }

    ssize_t n;
    do {
        n = recv(fd, buf, len, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
        logError("SocketStream::read", std::strerror(errno));
    return n;
}

bool SocketStream::write(const char *data, size_t len) {
    if (fd < 0)
        return false;
    return sendAll(fd, data, len);
}

// send() で直接書いているのでバッファは持たない
bool SocketStream::flush() {
    return fd >= 0;
}

void SocketStream::close() {
    if (fd < 0)
        return;

    std::ostringstream oss;
    oss << "Closing connection: fd=" << fd;
    logMessage(INFO, oss.str());

    shutdown(fd, SHUT_WR);
    ::close(fd);
    fd = -1;
}

bool sendAll(int fd, const char *buf, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        // 相手が切断済みでも SIGPIPE で落ちないように
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0) {
            logError("sendAll", n < 0 ? std::strerror(errno) : "connection closed");
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

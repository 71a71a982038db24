#include "termxfer/FdSession.hpp"
#include "termxfer/ReadInterrupt.hpp"

#include <algorithm>
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace termxfer {

namespace {
constexpr std::size_t kWriteChunk = 4096;
}

FdSession::FdSession(int readFd, int writeFd, bool ownsFds,
                     ConnectionKind kind)
    : readFd_(readFd), writeFd_(writeFd), ownsFds_(ownsFds), kind_(kind) {}

FdSession::~FdSession() {
    if (!ownsFds_)
        return;
    if (readFd_ >= 0)
        ::close(readFd_);
    if (writeFd_ >= 0 && writeFd_ != readFd_)
        ::close(writeFd_);
}

IoResult FdSession::read(char *buf, std::size_t len,
                         ReadInterrupt *interrupt) {
    IoResult r;
    if (readFd_ < 0) {
        r.status = IoStatus::Closed;
        return r;
    }
    for (;;) {
        if (interrupt && interrupt->triggered()) {
            r.status = IoStatus::Interrupted;
            return r;
        }
        struct pollfd pfds[2];
        nfds_t n = 1;
        pfds[0] = {readFd_, POLLIN, 0};
        int timeoutMs = -1;
        if (interrupt && interrupt->valid()) {
            pfds[1] = {interrupt->fd(), POLLIN, 0};
            n = 2;
            timeoutMs = interrupt->pollTimeoutMs();
        }
        const int rc = ::poll(pfds, n, timeoutMs);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            r.status = IoStatus::Error;
            r.sysErrno = errno;
            return r;
        }
        if (rc == 0)
            continue; // deadline reached; triggered() reports it
        if (n == 2 && (pfds[1].revents & POLLIN)) {
            r.status = IoStatus::Interrupted;
            return r;
        }
        if (pfds[0].revents & POLLNVAL) {
            r.status = IoStatus::Closed;
            return r;
        }
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t got = ::read(readFd_, buf, len);
            if (got > 0) {
                r.bytes = static_cast<std::size_t>(got);
                return r;
            }
            if (got == 0) {
                r.status = IoStatus::Eof;
                return r;
            }
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            r.status = (errno == EBADF) ? IoStatus::Closed : IoStatus::Error;
            r.sysErrno = errno;
            return r;
        }
    }
}

IoResult FdSession::write(const char *data, std::size_t len,
                          ReadInterrupt *interrupt) {
    std::lock_guard<std::mutex> lk(writeMtx_);
    IoResult r;
    if (writeFd_ < 0) {
        r.status = IoStatus::Closed;
        return r;
    }
    const bool interruptible = interrupt && interrupt->valid();
    while (r.bytes < len) {
        std::size_t chunk = len - r.bytes;
        if (interruptible) {
            if (interrupt->triggered()) {
                r.status = IoStatus::Interrupted;
                return r;
            }
            // Only write once the peer has room, so a blocking descriptor
            // cannot park us inside write() past the interrupt.
            struct pollfd pfds[2];
            pfds[0] = {writeFd_, POLLOUT, 0};
            pfds[1] = {interrupt->fd(), POLLIN, 0};
            const int rc = ::poll(pfds, 2, interrupt->pollTimeoutMs());
            if (rc < 0) {
                if (errno == EINTR)
                    continue;
                r.status = IoStatus::Error;
                r.sysErrno = errno;
                return r;
            }
            if (rc == 0)
                continue; // deadline reached; triggered() reports it
            if (pfds[1].revents & POLLIN) {
                r.status = IoStatus::Interrupted;
                return r;
            }
            if (pfds[0].revents & POLLNVAL) {
                r.status = IoStatus::Closed;
                return r;
            }
            // POLLOUT guarantees room for PIPE_BUF bytes on a pipe and at
            // least that much on a socket.
            chunk = std::min(chunk, kWriteChunk);
        }
        const ssize_t n = ::write(writeFd_, data + r.bytes, chunk);
        if (n > 0) {
            r.bytes += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!interruptible) {
                struct pollfd p = {writeFd_, POLLOUT, 0};
                (void)::poll(&p, 1, 100);
            }
            continue;
        }
        r.sysErrno = errno;
        r.status = (errno == EPIPE || errno == EBADF || errno == ECONNRESET)
                       ? IoStatus::Closed
                       : IoStatus::Error;
        return r;
    }
    return r;
}

PtyInfo FdSession::pty() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pty_;
}

void FdSession::setResizeHandler(ResizeHandler handler) {
    std::lock_guard<std::mutex> lk(mtx_);
    resize_ = std::move(handler);
}

void FdSession::setPty(const PtyInfo &info) {
    std::lock_guard<std::mutex> lk(mtx_);
    pty_ = info;
}

void FdSession::notifyResize(const WindowSize &ws) {
    std::lock_guard<std::mutex> lk(mtx_);
    pty_.window = ws;
    if (resize_)
        resize_(ws);
}

} // namespace termxfer

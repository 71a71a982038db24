#include "BridgeIo.hpp"
#include "termxfer/Logging.hpp"
#include "termxfer/TransportBridge.hpp"

#include <QFileInfo>
#include <QStringList>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace termxfer {
namespace detail {

QString programLabel(const std::string &program) {
    return QFileInfo(QString::fromStdString(program)).fileName();
}

void setNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

bool writeAllToFd(int fd, const char *data, std::size_t len,
                  ReadInterrupt *stop) {
    std::size_t done = 0;
    while (done < len) {
        const ssize_t n = ::write(fd, data + done, len - done);
        if (n > 0) {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            struct pollfd pfds[2];
            nfds_t cnt = 1;
            pfds[0] = {fd, POLLOUT, 0};
            if (stop && stop->valid()) {
                pfds[1] = {stop->fd(), POLLIN, 0};
                cnt = 2;
            }
            const int rc = ::poll(pfds, cnt, -1);
            if (rc < 0 && errno != EINTR)
                return false;
            if (cnt == 2 && (pfds[1].revents & POLLIN))
                return false;
            if (pfds[0].revents & (POLLERR | POLLNVAL))
                return false;
            continue;
        }
        return false;
    }
    return true;
}

std::size_t copyFdToSession(int fd, Session &session, ReadInterrupt &stop,
                            const QString &label, const char *what) {
    std::vector<char> buf(32 * 1024);
    std::size_t total = 0;
    const char *reason = "eof";
    for (;;) {
        struct pollfd pfds[2];
        pfds[0] = {fd, POLLIN, 0};
        pfds[1] = {stop.fd(), POLLIN, 0};
        const int rc = ::poll(pfds, stop.valid() ? 2 : 1, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            reason = "poll error";
            break;
        }
        if (stop.valid() && (pfds[1].revents & POLLIN)) {
            reason = "stopped";
            break;
        }
        if (pfds[0].revents & POLLNVAL) {
            reason = "closed";
            break;
        }
        if (!(pfds[0].revents & (POLLIN | POLLHUP | POLLERR)))
            continue;
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            const IoResult w =
                session.write(buf.data(), static_cast<std::size_t>(n), &stop);
            total += w.bytes;
            if (w.status == IoStatus::Interrupted) {
                reason = "stopped while the session was not accepting output";
                break;
            }
            if (w.status != IoStatus::Ok) {
                reason = "session write failed";
                break;
            }
            continue;
        }
        if (n == 0)
            break;
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            continue;
        // EIO: PTY slave side closed after the driver exited.
        if (errno == EIO || errno == EBADF) {
            reason = "closed";
            break;
        }
        qCWarning(txBridge) << label << what << "read error:"
                            << std::strerror(errno);
        reason = "read error";
        break;
    }
    qCDebug(txBridge) << label << what << "copy finished. Bytes:"
                      << static_cast<qulonglong>(total) << "reason:" << reason;
    return total;
}

std::string collectStream(int fd, ReadInterrupt &stop, std::size_t limit) {
    std::string out;
    char buf[4096];
    bool stopping = false;
    auto take = [&](ssize_t n) {
        if (out.size() < limit)
            out.append(buf, std::min(static_cast<std::size_t>(n),
                                     limit - out.size()));
    };
    for (;;) {
        if (!stopping) {
            struct pollfd pfds[2];
            pfds[0] = {fd, POLLIN, 0};
            pfds[1] = {stop.fd(), POLLIN, 0};
            const int rc = ::poll(pfds, stop.valid() ? 2 : 1, -1);
            if (rc < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (stop.valid() && (pfds[1].revents & POLLIN)) {
                // Take what the driver already wrote, then leave.
                stopping = true;
                setNonBlocking(fd);
                continue;
            }
            if (pfds[0].revents & POLLNVAL)
                break;
            if (!(pfds[0].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
        }
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            take(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && !stopping && (errno == EAGAIN || errno == EWOULDBLOCK))
            continue;
        break;
    }
    return out;
}

void logStderr(const QString &label, const std::string &text) {
    const QStringList lines =
        QString::fromLocal8Bit(text.data(), static_cast<int>(text.size()))
            .split(QLatin1Char('\n'));
    for (const QString &raw : lines) {
        const QString line = raw.trimmed();
        if (!line.isEmpty())
            qCInfo(txBridge).noquote() << "[" + label + " stderr]" << line;
    }
}

TransferError cancelError(const CancelToken &cancel, bool deadlineHit) {
    if (cancel.reason() == CancelReason::Cancelled)
        return TransferError::Cancelled;
    if (deadlineHit || cancel.reason() == CancelReason::DeadlineExceeded)
        return TransferError::DeadlineExceeded;
    return TransferError::Cancelled;
}

bool isExpectedEnd(IoStatus st) {
    return st == IoStatus::Eof || st == IoStatus::Interrupted ||
           st == IoStatus::Closed;
}

} // namespace detail

std::size_t drainSessionInput(Session &session, ReadInterrupt &interrupt,
                              const BridgeTimings &timings) {
    char buf[1024];
    std::size_t total = 0;
    const auto end = detail::Clock::now() + timings.drainWindow;
    while (detail::Clock::now() < end) {
        interrupt.clear();
        interrupt.setDeadline(
            std::min(detail::Clock::now() + timings.drainPollInterval, end));
        const IoResult r = session.read(buf, sizeof(buf), &interrupt);
        interrupt.clear();
        if (r.status != IoStatus::Ok || r.bytes == 0)
            break;
        total += r.bytes;
    }
    if (total > 0) {
        qCDebug(txBridge) << "drained" << static_cast<qulonglong>(total)
                          << "leftover bytes from session after transfer";
    }
    return total;
}

} // namespace termxfer

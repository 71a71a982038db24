// PTY mode: the driver sees a raw-mode terminal sized like the user's.
// EIO on the master after the driver exits is the normal end of output.
#include "BridgeIo.hpp"
#include "termxfer/ChildProcess.hpp"
#include "termxfer/Logging.hpp"
#include "termxfer/RuntimeLogging.hpp"
#include "termxfer/TransportBridge.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace termxfer {

namespace {

enum class PtyEvent { ProcessReaped, CancelRequested };

// Shared with the copy tasks, which may outlive runWithPty() when the
// session does not honour interrupts. Each task owns its own dup of the
// master, so closing the pty never hands a reused descriptor to a straggler.
struct PtyShared {
    detail::EventQueue<PtyEvent> events;
    ReadInterrupt readStop;
    ReadInterrupt outStop;
    detail::Latch inboundDone;
    detail::Latch outboundDone;
    int writeFd = -1; // inbound: session -> pty
    int readFd = -1;  // outbound: pty -> session
};

void ptyInboundLoop(const std::shared_ptr<PtyShared> &sh, Session &session,
                    const QString &label) {
    std::vector<char> buf(32 * 1024);
    std::size_t total = 0;
    const char *reason = "session eof";
    for (;;) {
        const IoResult r = session.read(buf.data(), buf.size(), &sh->readStop);
        if (r.status == IoStatus::Ok) {
            if (r.bytes == 0)
                continue;
            if (!detail::writeAllToFd(sh->writeFd, buf.data(), r.bytes,
                                      &sh->readStop)) {
                reason = "pty closed";
                break;
            }
            total += r.bytes;
            continue;
        }
        if (!detail::isExpectedEnd(r.status)) {
            qCWarning(txBridge) << label << "session read error:"
                                << std::strerror(r.sysErrno);
            reason = "session error";
        } else if (r.status == IoStatus::Interrupted) {
            reason = "interrupted";
        }
        break;
    }
    ::close(sh->writeFd);
    sh->writeFd = -1;
    qCDebug(txBridge) << label << "pty inbound copy finished. Bytes:"
                      << static_cast<qulonglong>(total) << "reason:" << reason;
    sh->inboundDone.set();
}

} // namespace

bool runWithPty(const CancelToken &cancel, Session &session,
                const CommandSpec &cmd, const BridgeOptions &opt,
                TransferResult &result) {
    const PtyInfo info = session.pty();
    if (!info.hasPty) {
        qCWarning(txBridge) << "session has no pty; running"
                            << detail::programLabel(cmd.program)
                            << "in direct mode";
        return runDirect(cancel, session, cmd, opt, result);
    }

    result = TransferResult{};
    const QString label = detail::programLabel(cmd.program);
    const BridgeTimings &t = opt.timings;

    if (cancel.isCancelled()) {
        result.error = detail::cancelError(cancel, false);
        result.message = "transfer cancelled before start";
        return false;
    }

    auto child = std::make_shared<ChildProcess>();
    std::string err;
    if (!child->startWithPty(cmd, info.window, err)) {
        qCWarning(txBridge) << "failed to start" << label << "on pty:"
                            << QString::fromStdString(err);
        result.error = TransferError::StartFailed;
        result.message = err;
        return false;
    }
    result.processId = child->pid();
    const int master = child->ptyFd();
    qCInfo(txBridge) << "pty transfer started:" << label << "pid"
                     << child->pid() << "args"
                     << QString::fromStdString(describeArgs(cmd.args))
                     << "window" << info.window.cols << "x" << info.window.rows;

    session.setResizeHandler([master, label](const WindowSize &ws) {
        struct winsize w {};
        w.ws_row = ws.rows;
        w.ws_col = ws.cols;
        if (::ioctl(master, TIOCSWINSZ, &w) != 0) {
            qCDebug(txBridge) << label << "pty resize failed:"
                              << std::strerror(errno);
        }
    });

    // Raw mode on the driver's terminal, restored before the pty is closed.
    struct termios saved {};
    const bool haveSaved = ::tcgetattr(master, &saved) == 0;
    if (haveSaved) {
        struct termios raw = saved;
        ::cfmakeraw(&raw);
        if (::tcsetattr(master, TCSANOW, &raw) != 0) {
            qCWarning(txBridge) << label << "could not set raw mode:"
                                << std::strerror(errno);
        }
    } else {
        qCWarning(txBridge) << label << "tcgetattr failed:"
                            << std::strerror(errno);
    }

    auto sh = std::make_shared<PtyShared>();
    sh->writeFd = ::fcntl(master, F_DUPFD_CLOEXEC, 0);
    sh->readFd = ::fcntl(master, F_DUPFD_CLOEXEC, 0);
    if (sh->writeFd < 0 || sh->readFd < 0) {
        const std::string why = std::string("dup pty: ") + std::strerror(errno);
        qCWarning(txBridge) << label << QString::fromStdString(why);
        if (sh->writeFd >= 0)
            ::close(sh->writeFd);
        if (sh->readFd >= 0)
            ::close(sh->readFd);
        session.setResizeHandler({});
        child->kill();
        child->wait();
        result.error = TransferError::StartFailed;
        result.message = why;
        return false;
    }
    detail::setNonBlocking(sh->writeFd);

    std::thread outboundTask([sh, &session, label] {
        detail::copyFdToSession(sh->readFd, session, sh->outStop, label,
                                "pty outbound");
        ::close(sh->readFd);
        sh->readFd = -1;
        sh->outboundDone.set();
    });
    std::thread inboundTask([sh, &session, label] {
        ptyInboundLoop(sh, session, label);
    });
    std::thread reaper([child, sh] {
        child->wait();
        sh->events.push(PtyEvent::ProcessReaped);
    });

    bool cancelled = false;
    bool deadlineHit = false;
    {
        std::weak_ptr<PtyShared> weak = sh;
        CancelSubscription sub(cancel, [weak] {
            if (auto s = weak.lock())
                s->events.push(PtyEvent::CancelRequested);
        });
        for (;;) {
            std::optional<detail::Clock::time_point> until;
            if (!cancelled)
                until = cancel.deadline();
            PtyEvent ev;
            if (!sh->events.waitPop(ev, until)) {
                if (detail::Clock::now() < *until)
                    continue;
                ev = PtyEvent::CancelRequested;
                deadlineHit = true;
            }
            if (ev == PtyEvent::ProcessReaped)
                break;
            if (!cancelled) {
                cancelled = true;
                qCInfo(txBridge) << "killing" << label << "pid"
                                 << result.processId << "cause: cancelled";
                child->kill();
            }
        }
    }
    reaper.join();
    const ExitStatus st = child->wait();
    result.exitCode = st.exited ? st.code : -1;
    result.termSignal = st.signal;

    sh->readStop.trigger();
    const bool inboundJoined = sh->inboundDone.waitFor(t.inputJoinTimeout);
    if (inboundJoined) {
        inboundTask.join();
    } else {
        qCWarning(txBridge) << label << "pty inbound copy did not stop within"
                            << static_cast<qlonglong>(t.inputJoinTimeout.count())
                            << "ms; detaching it";
        inboundTask.detach();
    }

    if (haveSaved && ::tcsetattr(master, TCSANOW, &saved) != 0) {
        // Expected once the slave side is gone.
        qCDebug(txBridge) << label << "terminal restore skipped:"
                          << std::strerror(errno);
    }
    session.setResizeHandler({});

    // Let trailing driver output reach the user unless the transfer was
    // cancelled, then stop the copy and close the pty.
    if (cancelled || !sh->outboundDone.waitFor(t.ptyOutputFlush))
        sh->outStop.trigger();
    if (sh->outboundDone.waitFor(t.postOutputGrace)) {
        outboundTask.join();
    } else {
        qCWarning(txBridge) << label << "session did not accept pty output for"
                            << static_cast<qlonglong>(t.postOutputGrace.count())
                            << "ms; abandoning the output copy";
        outboundTask.detach();
    }
    child->closePty();
    if (inboundJoined)
        sh->readStop.clear();

    if (cancelled) {
        result.cause = EndCause::Cancelled;
        result.error = detail::cancelError(cancel, deadlineHit);
        result.message = result.error == TransferError::DeadlineExceeded
                             ? "transfer deadline exceeded"
                             : "transfer cancelled";
    } else {
        result.cause = EndCause::NormalExit;
        if (st.signal != 0) {
            result.error = TransferError::AbnormalExit;
            result.message =
                "transfer driver killed by signal " + std::to_string(st.signal);
        } else if (!st.success()) {
            result.error = TransferError::AbnormalExit;
            result.message =
                "transfer driver exited with status " + std::to_string(st.code);
        }
    }

    if (result.ok()) {
        qCInfo(txBridge) << "pty transfer finished:" << label;
    } else {
        qCWarning(txBridge) << "pty transfer failed:" << label
                            << transferErrorName(result.error)
                            << QString::fromStdString(result.message);
    }
    return result.ok();
}

} // namespace termxfer

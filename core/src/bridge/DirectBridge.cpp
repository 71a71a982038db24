// Direct (pipe) mode. The calling thread drives a DirectTransferStateMachine
// from one event queue fed by the outbound copy, the reaper, the idle
// watchdog, the inbound scanner and the cancel token. Deadlines (caller and
// grace period) are handled by the controller's own timed wait.
#include "BridgeIo.hpp"
#include "termxfer/ChildProcess.hpp"
#include "termxfer/Logging.hpp"
#include "termxfer/RuntimeLogging.hpp"
#include "termxfer/TransferMonitor.hpp"
#include "termxfer/TransportBridge.hpp"

#include <cstring>
#include <memory>
#include <thread>
#include <unistd.h>
#include <vector>

namespace termxfer {

namespace {

constexpr std::size_t kStderrLimit = 64 * 1024;

// Everything the copy tasks touch. Shared because a session without
// interruptible I/O may keep either task blocked after runDirect() returned.
struct DirectShared {
    detail::EventQueue<DirectEvent> events;
    ReadInterrupt readStop;
    ReadInterrupt outStop;
    detail::Latch inboundDone;
    std::unique_ptr<IdleWatchdog> watchdog;
    int stdinFd = -1;
    std::size_t bytesIn = 0;
};

void inboundLoop(const std::shared_ptr<DirectShared> &sh, Session &session,
                 const QString &label) {
    std::vector<char> buf(32 * 1024);
    InboundScanner scanner;
    const bool monitor = sh->watchdog != nullptr;
    const char *reason = "session eof";
    for (;;) {
        const IoResult r = session.read(buf.data(), buf.size(), &sh->readStop);
        if (r.status == IoStatus::Ok) {
            if (r.bytes == 0)
                continue;
            if (monitor) {
                const InboundScanner::Result scan =
                    scanner.scan(buf.data(), r.bytes);
                if (scan.activity)
                    sh->watchdog->activity();
                if (scan.abortDetected) {
                    qCInfo(txBridge) << label
                                     << "abort sequence received from client";
                    sh->events.push(DirectEvent::AbortSequence);
                    reason = "abort sequence";
                    break;
                }
            }
            if (!detail::writeAllToFd(sh->stdinFd, buf.data(), r.bytes,
                                      &sh->readStop)) {
                reason = "driver stdin closed";
                break;
            }
            sh->bytesIn += r.bytes;
            continue;
        }
        if (r.status == IoStatus::Interrupted) {
            reason = "interrupted";
        } else if (r.status == IoStatus::Closed) {
            reason = "session closed";
        } else if (r.status == IoStatus::Error) {
            qCWarning(txBridge) << label << "session read error:"
                                << std::strerror(r.sysErrno);
            reason = "session error";
        }
        break;
    }
    // EOF on the driver's stdin.
    ::close(sh->stdinFd);
    sh->stdinFd = -1;
    qCDebug(txBridge) << label << "inbound copy finished. Bytes:"
                      << static_cast<qulonglong>(sh->bytesIn)
                      << "reason:" << reason;
    sh->inboundDone.set();
}

void writeAbortSequence(Session &session, std::chrono::milliseconds limit,
                        TransferResult &result) {
    std::string seq(kAbortSequenceCancels, static_cast<char>(kCancelByte));
    seq += "\r\n";
    ReadInterrupt stop;
    stop.setDeadline(detail::Clock::now() + limit);
    const IoResult w = session.write(seq.data(), seq.size(), &stop);
    result.abortSent = w.status == IoStatus::Ok;
    if (!result.abortSent)
        qCDebug(txBridge) << "abort sequence not delivered; session gone";
}

void describeEnd(const DirectTransferStateMachine &sm, const ExitStatus &st,
                 const CancelToken &cancel, bool deadlineHit,
                 std::chrono::milliseconds idle, TransferResult &result) {
    result.cause = sm.cause();
    switch (sm.cause()) {
    case EndCause::Cancelled:
        result.error = detail::cancelError(cancel, deadlineHit);
        result.message = result.error == TransferError::DeadlineExceeded
                             ? "transfer deadline exceeded"
                             : "transfer cancelled";
        return;
    case EndCause::IdleTimedOut:
        result.error = TransferError::AbnormalExit;
        result.message = "no inbound activity for " +
                         std::to_string(idle.count()) +
                         " ms; transfer driver killed";
        return;
    case EndCause::AbortDetected:
        result.error = TransferError::AbnormalExit;
        result.message = "client aborted the transfer";
        return;
    default:
        break;
    }
    if (sm.forcedKill()) {
        result.error = TransferError::AbnormalExit;
        result.message =
            "transfer driver did not exit after its output closed; killed";
    } else if (st.signal != 0) {
        result.error = TransferError::AbnormalExit;
        result.message =
            "transfer driver killed by signal " + std::to_string(st.signal);
    } else if (!st.success()) {
        result.error = TransferError::AbnormalExit;
        result.message =
            "transfer driver exited with status " + std::to_string(st.code);
    }
}

} // namespace

bool runDirect(const CancelToken &cancel, Session &session,
               const CommandSpec &cmd, const BridgeOptions &opt,
               TransferResult &result) {
    result = TransferResult{};
    const QString label = detail::programLabel(cmd.program);
    const BridgeTimings &t = opt.timings;

    if (cancel.isCancelled()) {
        result.error = detail::cancelError(cancel, false);
        result.message = "transfer cancelled before start";
        return false;
    }

    DirectTransferStateMachine sm;
    auto child = std::make_shared<ChildProcess>();
    std::string err;
    if (!child->startWithPipes(cmd, err)) {
        sm.apply(DirectEvent::StartFailed);
        qCWarning(txBridge) << "failed to start" << label << ":"
                            << QString::fromStdString(err);
        result.error = TransferError::StartFailed;
        result.message = err;
        return false;
    }
    sm.apply(DirectEvent::Started);
    result.processId = child->pid();
    qCInfo(txBridge) << "direct transfer started:" << label << "pid"
                     << child->pid() << "args"
                     << QString::fromStdString(describeArgs(cmd.args))
                     << "idle timeout ms"
                     << static_cast<qlonglong>(opt.idleTimeout.count());

    auto sh = std::make_shared<DirectShared>();
    sh->stdinFd = child->releaseStdin();
    detail::setNonBlocking(sh->stdinFd);
    if (opt.idleTimeout.count() > 0) {
        DirectShared *raw = sh.get();
        sh->watchdog = std::make_unique<IdleWatchdog>(
            opt.idleTimeout,
            [raw] { raw->events.push(DirectEvent::IdleTimeout); });
    }

    ReadInterrupt errStop;
    std::string stderrText;

    std::thread stderrTask([&] {
        stderrText = detail::collectStream(child->stderrFd(), errStop,
                                           kStderrLimit);
    });
    std::thread outboundTask([child, sh, &session, label] {
        detail::copyFdToSession(child->stdoutFd(), session, sh->outStop, label,
                                "outbound");
        sh->events.push(DirectEvent::OutputClosed);
    });
    std::thread reaper([child, sh] {
        child->wait();
        sh->events.push(DirectEvent::ProcessReaped);
    });
    std::thread inboundTask([sh, &session, label] {
        inboundLoop(sh, session, label);
    });
    if (sh->watchdog)
        sh->watchdog->start();

    bool deadlineHit = false;
    std::optional<detail::Clock::time_point> graceDeadline;
    // After a kill the output copy gets postOutputGrace to finish; a session
    // that stopped accepting writes must not hold the transfer open.
    std::optional<detail::Clock::time_point> outputDeadline;
    {
        std::weak_ptr<DirectShared> weak = sh;
        CancelSubscription sub(cancel, [weak] {
            if (auto s = weak.lock())
                s->events.push(DirectEvent::CancelRequested);
        });

        while (sm.state() != DirectState::Terminated) {
            std::optional<detail::Clock::time_point> until;
            if (!sm.killRequested())
                until = cancel.deadline();
            if (graceDeadline && (!until || *graceDeadline < *until))
                until = graceDeadline;
            if (outputDeadline && !sm.outputClosed() &&
                (!until || *outputDeadline < *until))
                until = outputDeadline;

            DirectEvent ev;
            if (!sh->events.waitPop(ev, until)) {
                const auto now = detail::Clock::now();
                if (graceDeadline && now >= *graceDeadline) {
                    ev = DirectEvent::GraceExpired;
                    graceDeadline.reset();
                } else if (outputDeadline && !sm.outputClosed() &&
                           now >= *outputDeadline) {
                    ev = DirectEvent::OutputAbandoned;
                    outputDeadline.reset();
                } else if (!sm.killRequested() && cancel.deadline() &&
                           now >= *cancel.deadline()) {
                    ev = DirectEvent::CancelRequested;
                    deadlineHit = true;
                } else {
                    continue;
                }
            }

            const DirectState before = sm.state();
            const bool killBefore = sm.killRequested();
            if (!sm.apply(ev)) {
                qCDebug(txBridge) << "ignored" << directEventName(ev) << "in"
                                  << directStateName(before);
                continue;
            }
            if (sm.state() != before) {
                qCDebug(txBridge) << directStateName(before) << "->"
                                  << directStateName(sm.state()) << "on"
                                  << directEventName(ev);
            }

            if (sm.killRequested() && !killBefore) {
                qCInfo(txBridge) << "killing" << label << "pid"
                                 << result.processId << "cause:"
                                 << endCauseName(sm.cause());
                child->kill();
                sh->outStop.trigger();
                if (!sm.outputClosed())
                    outputDeadline = detail::Clock::now() + t.postOutputGrace;
            }
            if (ev == DirectEvent::OutputAbandoned) {
                qCWarning(txBridge)
                    << label << "session did not accept output for"
                    << static_cast<qlonglong>(t.postOutputGrace.count())
                    << "ms after the kill; abandoning the output copy";
            }
            if (ev == DirectEvent::GraceExpired) {
                qCWarning(txBridge)
                    << label << "still running"
                    << static_cast<qlonglong>(t.postOutputGrace.count())
                    << "ms after its output closed; forcing kill";
                child->kill();
            }
            if (sm.state() == DirectState::GraceWait &&
                before != DirectState::GraceWait && !sm.forcedKill()) {
                graceDeadline = detail::Clock::now() + t.postOutputGrace;
            }
        }
    }

    reaper.join();
    if (sm.outputAbandoned()) {
        // The task owns a reference to the child and the shared state; it
        // ends once the session write returns.
        outboundTask.detach();
    } else {
        outboundTask.join();
    }
    if (sh->watchdog)
        sh->watchdog->stop();
    const ExitStatus st = child->wait();
    result.exitCode = st.exited ? st.code : -1;
    result.termSignal = st.signal;

    describeEnd(sm, st, cancel, deadlineHit, opt.idleTimeout, result);
    const bool abnormal = sm.cause() != EndCause::NormalExit ||
                          sm.forcedKill() || !st.success();
    if (abnormal && sm.outputAbandoned()) {
        qCDebug(txBridge)
            << "abort sequence skipped; session not accepting output";
    } else if (abnormal) {
        writeAbortSequence(session, t.inputJoinTimeout, result);
    }

    errStop.trigger();
    stderrTask.join();
    detail::logStderr(label, stderrText);

    sm.apply(DirectEvent::DrainStarted);
    sh->readStop.trigger();
    bool inboundJoined = sh->inboundDone.waitFor(t.inputJoinTimeout);
    if (inboundJoined) {
        inboundTask.join();
    } else {
        // The task owns the driver stdin and the shared state; it ends when
        // the session's pending read finally returns.
        qCWarning(txBridge) << label << "inbound copy did not stop within"
                            << static_cast<qlonglong>(t.inputJoinTimeout.count())
                            << "ms; detaching it";
        inboundTask.detach();
    }

    if (inboundJoined) {
        sh->readStop.clear();
        if (session.supportsReadInterrupt()) {
            std::this_thread::sleep_for(t.drainPause);
            drainSessionInput(session, sh->readStop, t);
        }
    }
    sm.apply(DirectEvent::DrainFinished);

    if (result.ok()) {
        qCInfo(txBridge) << "direct transfer finished:" << label;
    } else {
        qCWarning(txBridge) << "direct transfer failed:" << label
                            << transferErrorName(result.error)
                            << QString::fromStdString(result.message);
    }
    return result.ok();
}

} // namespace termxfer

// Inbound-stream analysis for Direct-mode receives and the explicit state
// machine that orders a Direct transfer's shutdown.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace termxfer {

constexpr unsigned char kCancelByte = 0x18; // CAN
constexpr int kAbortCancelRun = 5;
// Written to the client after an abnormal end: 8x CAN then CR LF.
constexpr int kAbortSequenceCancels = 8;

// Counts consecutive CAN bytes across chunks. CAN never counts as activity,
// otherwise an abort burst would keep postponing the idle timeout.
class InboundScanner {
public:
    explicit InboundScanner(int abortRun = kAbortCancelRun,
                            unsigned char cancelByte = kCancelByte)
        : abortRun_(abortRun), cancelByte_(cancelByte) {}

    struct Result {
        bool activity = false;       // chunk had at least one non-CAN byte
        bool abortDetected = false;  // run reached the threshold in this chunk
    };

    Result scan(const char *data, std::size_t len);
    int consecutiveCancels() const { return run_; }
    bool aborted() const { return aborted_; }

private:
    int abortRun_;
    unsigned char cancelByte_;
    int run_ = 0;
    bool aborted_ = false;
};

// Fires `onIdle` once when activity() was not called for `window`.
class IdleWatchdog {
public:
    IdleWatchdog(std::chrono::milliseconds window, std::function<void()> onIdle);
    ~IdleWatchdog();
    IdleWatchdog(const IdleWatchdog &) = delete;
    IdleWatchdog &operator=(const IdleWatchdog &) = delete;

    void start();
    void activity();
    void stop(); // joins; onIdle will not run afterwards
    bool fired() const;

private:
    void run();

    std::chrono::milliseconds window_;
    std::function<void()> onIdle_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool fired_ = false;
    std::chrono::steady_clock::time_point lastActivity_;
    std::thread thread_;
};

enum class DirectState {
    Starting,
    Running,
    NormalExit,
    IdleTimedOut,
    AbortDetected,
    Cancelled,
    GraceWait,
    Terminated,
    Draining,
    Done
};

enum class DirectEvent {
    Started,
    StartFailed,
    OutputClosed,    // stdout copy ended
    ProcessReaped,
    IdleTimeout,
    AbortSequence,
    CancelRequested,
    GraceExpired,    // forced kill issued; still waiting for the reap
    OutputAbandoned, // killed, but the stdout copy is stuck on the session
    DrainStarted,
    DrainFinished
};

const char *directStateName(DirectState s);
const char *directEventName(DirectEvent e);

// Starting -> Running -> {NormalExit | IdleTimedOut | AbortDetected |
// Cancelled} -> GraceWait -> Terminated -> Draining -> Done.
// GraceWait is skipped when the process was reaped before the output closed.
// After a kill, an output copy that never finishes is abandoned instead of
// closed, so a client that stopped reading cannot hold the transfer open.
// apply() returns false and leaves the state untouched for events that are
// not valid in the current state (late races are expected and ignored).
class DirectTransferStateMachine {
public:
    DirectState state() const { return state_; }
    EndCause cause() const { return cause_; }
    bool outputClosed() const { return outputClosed_; }
    bool reaped() const { return reaped_; }
    bool forcedKill() const { return forcedKill_; }
    bool outputAbandoned() const { return outputAbandoned_; }

    bool apply(DirectEvent ev);

    // The controller should kill the process and stop the outbound copy.
    bool killRequested() const {
        return cause_ == EndCause::IdleTimedOut ||
               cause_ == EndCause::AbortDetected ||
               cause_ == EndCause::Cancelled;
    }
    bool inGrace() const { return state_ == DirectState::GraceWait; }

private:
    void settleIfPossible();

    DirectState state_ = DirectState::Starting;
    EndCause cause_ = EndCause::None;
    bool outputClosed_ = false;
    bool reaped_ = false;
    bool forcedKill_ = false;
    bool outputAbandoned_ = false;
};

} // namespace termxfer

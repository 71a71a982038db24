#include "termxfer/TransferMonitor.hpp"

namespace termxfer {

InboundScanner::Result InboundScanner::scan(const char *data, std::size_t len) {
    Result r;
    for (std::size_t i = 0; i < len; ++i) {
        if (static_cast<unsigned char>(data[i]) == cancelByte_) {
            ++run_;
            if (run_ >= abortRun_ && !aborted_) {
                aborted_ = true;
                r.abortDetected = true;
            }
        } else {
            run_ = 0;
            r.activity = true;
        }
    }
    return r;
}

IdleWatchdog::IdleWatchdog(std::chrono::milliseconds window,
                           std::function<void()> onIdle)
    : window_(window), onIdle_(std::move(onIdle)) {}

IdleWatchdog::~IdleWatchdog() { stop(); }

void IdleWatchdog::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (thread_.joinable())
        return;
    lastActivity_ = std::chrono::steady_clock::now();
    thread_ = std::thread([this] { run(); });
}

void IdleWatchdog::activity() {
    std::lock_guard<std::mutex> lk(mtx_);
    lastActivity_ = std::chrono::steady_clock::now();
}

void IdleWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

bool IdleWatchdog::fired() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return fired_;
}

void IdleWatchdog::run() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stop_) {
        // activity() only moves lastActivity_; the deadline is recomputed
        // each time the previous one is reached.
        const auto deadline = lastActivity_ + window_;
        if (std::chrono::steady_clock::now() >= deadline) {
            fired_ = true;
            auto cb = onIdle_;
            lk.unlock();
            if (cb)
                cb();
            return;
        }
        cv_.wait_until(lk, deadline);
    }
}

const char *directStateName(DirectState s) {
    switch (s) {
    case DirectState::Starting:
        return "Starting";
    case DirectState::Running:
        return "Running";
    case DirectState::NormalExit:
        return "NormalExit";
    case DirectState::IdleTimedOut:
        return "IdleTimedOut";
    case DirectState::AbortDetected:
        return "AbortDetected";
    case DirectState::Cancelled:
        return "Cancelled";
    case DirectState::GraceWait:
        return "GraceWait";
    case DirectState::Terminated:
        return "Terminated";
    case DirectState::Draining:
        return "Draining";
    case DirectState::Done:
        return "Done";
    }
    return "Unknown";
}

const char *directEventName(DirectEvent e) {
    switch (e) {
    case DirectEvent::Started:
        return "Started";
    case DirectEvent::StartFailed:
        return "StartFailed";
    case DirectEvent::OutputClosed:
        return "OutputClosed";
    case DirectEvent::ProcessReaped:
        return "ProcessReaped";
    case DirectEvent::IdleTimeout:
        return "IdleTimeout";
    case DirectEvent::AbortSequence:
        return "AbortSequence";
    case DirectEvent::CancelRequested:
        return "CancelRequested";
    case DirectEvent::GraceExpired:
        return "GraceExpired";
    case DirectEvent::OutputAbandoned:
        return "OutputAbandoned";
    case DirectEvent::DrainStarted:
        return "DrainStarted";
    case DirectEvent::DrainFinished:
        return "DrainFinished";
    }
    return "Unknown";
}

void DirectTransferStateMachine::settleIfPossible() {
    if (!outputClosed_)
        return;
    state_ = reaped_ ? DirectState::Terminated : DirectState::GraceWait;
}

bool DirectTransferStateMachine::apply(DirectEvent ev) {
    switch (state_) {
    case DirectState::Starting:
        if (ev == DirectEvent::Started) {
            state_ = DirectState::Running;
            return true;
        }
        if (ev == DirectEvent::StartFailed) {
            state_ = DirectState::Done;
            return true;
        }
        return false;

    case DirectState::Running:
        switch (ev) {
        case DirectEvent::OutputClosed:
            outputClosed_ = true;
            cause_ = EndCause::NormalExit;
            state_ = DirectState::NormalExit;
            settleIfPossible();
            return true;
        case DirectEvent::ProcessReaped:
            // Output still open: the stdout copy stays authoritative.
            reaped_ = true;
            return true;
        case DirectEvent::IdleTimeout:
            cause_ = EndCause::IdleTimedOut;
            state_ = DirectState::IdleTimedOut;
            return true;
        case DirectEvent::AbortSequence:
            cause_ = EndCause::AbortDetected;
            state_ = DirectState::AbortDetected;
            return true;
        case DirectEvent::CancelRequested:
            cause_ = EndCause::Cancelled;
            state_ = DirectState::Cancelled;
            return true;
        default:
            return false;
        }

    case DirectState::NormalExit:
    case DirectState::IdleTimedOut:
    case DirectState::AbortDetected:
    case DirectState::Cancelled:
        switch (ev) {
        case DirectEvent::OutputClosed:
            if (outputClosed_)
                return false;
            outputClosed_ = true;
            settleIfPossible();
            return true;
        case DirectEvent::OutputAbandoned:
            if (outputClosed_ || !killRequested())
                return false;
            outputClosed_ = true;
            outputAbandoned_ = true;
            settleIfPossible();
            return true;
        case DirectEvent::ProcessReaped:
            if (reaped_)
                return false;
            reaped_ = true;
            settleIfPossible();
            return true;
        case DirectEvent::CancelRequested:
            if (cause_ != EndCause::NormalExit)
                return false;
            cause_ = EndCause::Cancelled;
            state_ = DirectState::Cancelled;
            settleIfPossible();
            return true;
        default:
            return false;
        }

    case DirectState::GraceWait:
        switch (ev) {
        case DirectEvent::ProcessReaped:
            reaped_ = true;
            state_ = DirectState::Terminated;
            return true;
        case DirectEvent::GraceExpired:
            forcedKill_ = true;
            return true;
        case DirectEvent::CancelRequested:
            if (cause_ != EndCause::NormalExit)
                return false;
            cause_ = EndCause::Cancelled;
            return true;
        default:
            return false;
        }

    case DirectState::Terminated:
        if (ev == DirectEvent::DrainStarted) {
            state_ = DirectState::Draining;
            return true;
        }
        return false;

    case DirectState::Draining:
        if (ev == DirectEvent::DrainFinished) {
            state_ = DirectState::Done;
            return true;
        }
        return false;

    case DirectState::Done:
        return false;
    }
    return false;
}

} // namespace termxfer

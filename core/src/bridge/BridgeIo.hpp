// Internal helpers shared by the PTY and Direct bridges.
#pragma once
#include "termxfer/CancelToken.hpp"
#include "termxfer/ReadInterrupt.hpp"
#include "termxfer/Session.hpp"
#include "termxfer/TransferTypes.hpp"

#include <QString>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace termxfer {
namespace detail {

using Clock = std::chrono::steady_clock;

template <typename Event> class EventQueue {
public:
    void push(Event e) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            q_.push_back(e);
        }
        cv_.notify_all();
    }

    // False when `until` passed with nothing queued.
    bool waitPop(Event &out, std::optional<Clock::time_point> until) {
        std::unique_lock<std::mutex> lk(mtx_);
        auto ready = [this] { return !q_.empty(); };
        if (until) {
            if (!cv_.wait_until(lk, *until, ready))
                return false;
        } else {
            cv_.wait(lk, ready);
        }
        out = q_.front();
        q_.pop_front();
        return true;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Event> q_;
};

// One-shot completion flag with a bounded wait.
class Latch {
public:
    void set() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            set_ = true;
        }
        cv_.notify_all();
    }
    bool waitFor(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, d, [this] { return set_; });
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    bool set_ = false;
};

QString programLabel(const std::string &program);

// Writes the whole buffer to a non-blocking fd, waiting for POLLOUT or the
// stop signal. False on error, EPIPE, or stop.
bool writeAllToFd(int fd, const char *data, std::size_t len,
                  ReadInterrupt *stop);

void setNonBlocking(int fd);

// fd -> session until EOF/EIO, a failed session write, or `stop`. `stop`
// also interrupts a session write blocked on a client that stopped reading.
std::size_t copyFdToSession(int fd, Session &session, ReadInterrupt &stop,
                            const QString &label, const char *what);

// Reads stderr until EOF; on `stop`, takes what is already buffered and
// returns. Keeps at most `limit` bytes.
std::string collectStream(int fd, ReadInterrupt &stop, std::size_t limit);

void logStderr(const QString &label, const std::string &text);

// Maps a fired token to the caller-visible error.
TransferError cancelError(const CancelToken &cancel, bool deadlineHit);

bool isExpectedEnd(IoStatus st);

} // namespace detail
} // namespace termxfer

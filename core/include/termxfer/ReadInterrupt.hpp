// Transfer-scoped signal that unblocks a pending read (without consuming
// input) or a write stuck on a peer that stopped reading. Backed by a
// self-pipe so fd-based I/O can poll() on it next to its data descriptor; an
// optional deadline turns it into a timeout.
#pragma once
#include <chrono>
#include <mutex>
#include <optional>

namespace termxfer {

class ReadInterrupt {
public:
    using Clock = std::chrono::steady_clock;

    ReadInterrupt();
    ~ReadInterrupt();
    ReadInterrupt(const ReadInterrupt &) = delete;
    ReadInterrupt &operator=(const ReadInterrupt &) = delete;

    bool valid() const { return fds_[0] >= 0; }
    // Descriptor that becomes readable once trigger() was called.
    int fd() const { return fds_[0]; }

    void trigger();
    // Resets the signal and any deadline.
    void clear();
    void setDeadline(Clock::time_point when);

    // True once triggered or after the deadline passed.
    bool triggered() const;
    // poll() timeout honouring the deadline: -1 without one, else >= 0.
    int pollTimeoutMs() const;

private:
    int fds_[2] = {-1, -1};
    mutable std::mutex mtx_;
    bool triggered_ = false;
    std::optional<Clock::time_point> deadline_;
};

} // namespace termxfer

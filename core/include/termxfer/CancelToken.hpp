// Cancellation/deadline token shared between the caller and one transfer.
// Copies share state: cancelling any copy cancels all of them.
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace termxfer {

enum class CancelReason { None, Cancelled, DeadlineExceeded };

class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();
    static CancelToken withTimeout(std::chrono::milliseconds timeout);
    static CancelToken withDeadline(Clock::time_point deadline);

    void cancel() const;
    bool isCancelled() const { return reason() != CancelReason::None; }
    // Cancelled wins over DeadlineExceeded when both apply.
    CancelReason reason() const;
    std::optional<Clock::time_point> deadline() const;

    // Callback runs once, on the cancelling thread (or immediately if the
    // token is already cancelled). Deadlines do not trigger callbacks;
    // waiters combine deadline() with their own wait_until.
    std::size_t subscribe(std::function<void()> cb) const;
    void unsubscribe(std::size_t id) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

// Unsubscribes on scope exit.
class CancelSubscription {
public:
    CancelSubscription(const CancelToken &token, std::function<void()> cb)
        : token_(token), id_(token.subscribe(std::move(cb))) {}
    ~CancelSubscription() { token_.unsubscribe(id_); }
    CancelSubscription(const CancelSubscription &) = delete;
    CancelSubscription &operator=(const CancelSubscription &) = delete;

private:
    CancelToken token_;
    std::size_t id_;
};

} // namespace termxfer

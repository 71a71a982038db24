#include "termxfer/CancelToken.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace termxfer {

struct CancelToken::State {
    std::mutex mtx;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
    std::size_t nextId = 1;
    std::unordered_map<std::size_t, std::function<void()>> callbacks;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

CancelToken CancelToken::withDeadline(Clock::time_point deadline) {
    CancelToken t;
    t.state_->deadline = deadline;
    return t;
}

void CancelToken::cancel() const {
    std::vector<std::function<void()>> toRun;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (state_->cancelled)
            return;
        state_->cancelled = true;
        toRun.reserve(state_->callbacks.size());
        for (auto &kv : state_->callbacks)
            toRun.push_back(std::move(kv.second));
        state_->callbacks.clear();
    }
    for (auto &cb : toRun) {
        if (cb)
            cb();
    }
}

CancelReason CancelToken::reason() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->cancelled)
        return CancelReason::Cancelled;
    if (state_->deadline && Clock::now() >= *state_->deadline)
        return CancelReason::DeadlineExceeded;
    return CancelReason::None;
}

std::optional<CancelToken::Clock::time_point> CancelToken::deadline() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->deadline;
}

std::size_t CancelToken::subscribe(std::function<void()> cb) const {
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        if (!state_->cancelled) {
            const std::size_t id = state_->nextId++;
            state_->callbacks.emplace(id, std::move(cb));
            return id;
        }
    }
    if (cb)
        cb();
    return 0;
}

void CancelToken::unsubscribe(std::size_t id) const {
    if (id == 0)
        return;
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->callbacks.erase(id);
}

} // namespace termxfer

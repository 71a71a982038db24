#include "termxfer/ReadInterrupt.hpp"
#include "termxfer/Logging.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace termxfer {

ReadInterrupt::ReadInterrupt() {
    if (::pipe2(fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
        qCWarning(txBridge) << "ReadInterrupt: pipe2 failed:"
                            << std::strerror(errno);
        fds_[0] = fds_[1] = -1;
    }
}

ReadInterrupt::~ReadInterrupt() {
    if (fds_[0] >= 0)
        ::close(fds_[0]);
    if (fds_[1] >= 0)
        ::close(fds_[1]);
}

void ReadInterrupt::trigger() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (triggered_)
        return;
    triggered_ = true;
    if (fds_[1] >= 0) {
        const char b = 1;
        ssize_t n;
        do {
            n = ::write(fds_[1], &b, 1);
        } while (n < 0 && errno == EINTR);
    }
}

void ReadInterrupt::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    triggered_ = false;
    deadline_.reset();
    if (fds_[0] >= 0) {
        char buf[64];
        while (::read(fds_[0], buf, sizeof(buf)) > 0) {
        }
    }
}

void ReadInterrupt::setDeadline(Clock::time_point when) {
    std::lock_guard<std::mutex> lk(mtx_);
    deadline_ = when;
}

bool ReadInterrupt::triggered() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (triggered_)
        return true;
    return deadline_ && Clock::now() >= *deadline_;
}

int ReadInterrupt::pollTimeoutMs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!deadline_)
        return -1;
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(
        *deadline_ - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

} // namespace termxfer

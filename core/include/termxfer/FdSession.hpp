// Session over a pair of file descriptors (a Telnet socket, a socketpair in
// tests, or the process's own stdin/stdout in the CLI).
#pragma once
#include "Session.hpp"
#include <mutex>

namespace termxfer {

class FdSession : public Session {
public:
    // Same descriptor for both directions is fine (sockets).
    FdSession(int readFd, int writeFd, bool ownsFds = false,
              ConnectionKind kind = ConnectionKind::Unknown);
    ~FdSession() override;

    IoResult read(char *buf, std::size_t len,
                  ReadInterrupt *interrupt) override;
    IoResult write(const char *data, std::size_t len,
                   ReadInterrupt *interrupt) override;

    PtyInfo pty() const override;
    void setResizeHandler(ResizeHandler handler) override;
    bool supportsReadInterrupt() const override { return true; }
    ConnectionKind connectionKind() const override { return kind_; }

    // Owner side: record negotiated terminal metadata and forward window
    // changes to whoever is attached.
    void setPty(const PtyInfo &info);
    void notifyResize(const WindowSize &ws);

private:
    int readFd_;
    int writeFd_;
    bool ownsFds_;
    ConnectionKind kind_;

    mutable std::mutex mtx_; // protects pty_ and resize_
    PtyInfo pty_;
    ResizeHandler resize_;
    std::mutex writeMtx_;
};

} // namespace termxfer

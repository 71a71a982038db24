// Abstract interface for a remote terminal session. The SSH and Telnet
// servers implement it; the transfer bridge only borrows it for the duration
// of one transfer and never closes it.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <functional>

namespace termxfer {

class ReadInterrupt;

enum class IoStatus {
    Ok,
    Eof,          // peer closed its side
    Interrupted,  // ReadInterrupt fired (or its deadline passed); no byte consumed
    Closed,       // descriptor/channel already torn down
    Error
};

struct IoResult {
    IoStatus status = IoStatus::Ok;
    std::size_t bytes = 0;
    int sysErrno = 0;
};

class Session {
public:
    using ResizeHandler = std::function<void(const WindowSize &)>;

    virtual ~Session() = default;

    // Blocks until at least one byte is available, the peer closes, or the
    // interrupt fires. Implementations without interrupt support may ignore
    // `interrupt`; such sessions must stay alive until the pending read
    // returns, since the bridge stops waiting for it after a bounded time.
    virtual IoResult read(char *buf, std::size_t len,
                          ReadInterrupt *interrupt) = 0;

    // Writes the whole buffer unless the session fails or `interrupt` fires;
    // on Interrupted, `bytes` is what was written before. A client that
    // stops reading must not hold a writer forever, so implementations should
    // honour the interrupt. One that does not keeps the bridge's output task
    // alive past the transfer, with the same lifetime rule as read().
    virtual IoResult write(const char *data, std::size_t len,
                           ReadInterrupt *interrupt) = 0;

    // Terminal metadata negotiated by the front end.
    virtual PtyInfo pty() const { return {}; }

    // Installs (or clears, with an empty function) the window-change
    // callback. Once this returns, the previous handler is neither running
    // nor invoked again.
    virtual void setResizeHandler(ResizeHandler handler) { (void)handler; }

    virtual bool supportsReadInterrupt() const { return false; }

    virtual ConnectionKind connectionKind() const {
        return ConnectionKind::Unknown;
    }
};

} // namespace termxfer

// Attaches an external transfer driver to a live session and returns only
// once the transfer has definitively ended: process reaped, copy tasks
// joined (or, for sessions without read interruption, abandoned after
// BridgeTimings::inputJoinTimeout), session left without a pending
// interrupt and with its terminal mode untouched.
#pragma once
#include "CancelToken.hpp"
#include "ChildProcess.hpp"
#include "Session.hpp"
#include "TransferTypes.hpp"
#include <chrono>
#include <cstddef>

namespace termxfer {

class ReadInterrupt;

struct BridgeOptions {
    // Direct mode only: kill the driver when no non-CAN byte arrives from
    // the client for this long; also enables in-band abort detection.
    std::chrono::milliseconds idleTimeout{0};
    BridgeTimings timings;
};

// Pipes for stdin/stdout, stderr captured and logged. Preferred for binary
// protocols: a PTY line discipline can itself mangle protocol bytes.
bool runDirect(const CancelToken &cancel, Session &session,
               const CommandSpec &cmd, const BridgeOptions &opt,
               TransferResult &result);

// Runs the driver on a raw-mode PTY sized like the session's terminal.
// Falls back to runDirect() when the session has no PTY.
bool runWithPty(const CancelToken &cancel, Session &session,
                const CommandSpec &cmd, const BridgeOptions &opt,
                TransferResult &result);

// Discards input left in the session after a transfer (ZFIN/OO, late ACKs)
// so it does not reach the next prompt. Stops at the first read that times
// out. Returns the number of bytes dropped.
std::size_t drainSessionInput(Session &session, ReadInterrupt &interrupt,
                              const BridgeTimings &timings);

} // namespace termxfer

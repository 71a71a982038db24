// Basic types shared by the registry, the bridge and the session adapters.
// Keep these structures plain so the menu layer can copy them freely.
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace termxfer {

// Which front end a session arrived through.
enum class ConnectionKind {
    Unknown, // adapter does not say; only unrestricted protocols apply
    Ssh,
    Telnet
};

// Restriction declared by a protocol entry ("connection_type" in JSON).
enum class ConnectionRestriction {
    Any,        // ""
    SshOnly,    // "ssh"
    TelnetOnly  // "telnet"
};

struct ProtocolConfig {
    std::string key;          // selection token shown to users (e.g. "Z")
    std::string name;         // display name
    std::string description;  // short help text
    std::string sendCommand;  // executable for sending (download to user)
    std::vector<std::string> sendArgs;
    std::string recvCommand;  // executable for receiving (upload from user)
    std::vector<std::string> recvArgs;
    bool supportsBatch = false;
    bool requiresPty = false;
    bool isDefault = false;
    ConnectionRestriction connectionRestriction = ConnectionRestriction::Any;
    // Kill the receive driver when no inbound activity arrives for this long.
    // Zero disables the idle monitor.
    std::chrono::milliseconds recvIdleTimeout{0};
};

struct WindowSize {
    std::uint16_t cols = 0;
    std::uint16_t rows = 0;
};

struct PtyInfo {
    bool hasPty = false;
    std::string terminalType;
    WindowSize window;
};

// Shutdown timings for the bridge. Defaults are tuned against sexyz/SyncTerm.
struct BridgeTimings {
    std::chrono::milliseconds postOutputGrace{5000};
    std::chrono::milliseconds inputJoinTimeout{2000};
    std::chrono::milliseconds drainPause{250};
    std::chrono::milliseconds drainWindow{500};
    std::chrono::milliseconds drainPollInterval{50};
    // PTY mode: how long to let trailing PTY output reach the session after
    // the process exits before the output task is stopped.
    std::chrono::milliseconds ptyOutputFlush{1000};
};

enum class TransferError {
    None,
    InvalidInput,     // rejected before any process was spawned
    BinaryNotFound,   // driver missing on PATH; show a sysop-actionable message
    StartFailed,      // pipes/pty/fork/exec failed
    Cancelled,        // caller cancelled the token
    DeadlineExceeded, // caller deadline passed
    AbnormalExit      // killed (idle/abort/grace) or non-zero exit status
};

const char *transferErrorName(TransferError e);

// How a Direct-mode transfer ended (see DirectTransferStateMachine).
enum class EndCause { None, NormalExit, IdleTimedOut, AbortDetected, Cancelled };

const char *endCauseName(EndCause c);

struct TransferResult {
    TransferError error = TransferError::None;
    EndCause cause = EndCause::None;
    std::string message;
    int exitCode = -1;   // valid when the process exited normally
    int termSignal = 0;  // non-zero when the process died from a signal
    long processId = -1;
    bool abortSent = false; // CAN sequence written to the session

    bool ok() const { return error == TransferError::None; }
};

} // namespace termxfer

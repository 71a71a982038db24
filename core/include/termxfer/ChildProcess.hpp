// External driver process: spawned either on three pipes or on a fresh
// pseudo-terminal. kill() and wait() may be called from different threads;
// the pid is never signalled after it has been reaped.
#pragma once
#include "TransferTypes.hpp"
#include <condition_variable>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace termxfer {

struct CommandSpec {
    std::string program; // absolute path
    std::vector<std::string> args;
    std::string workingDir; // empty = inherit
};

struct ExitStatus {
    bool exited = false;   // WIFEXITED
    int code = -1;
    int signal = 0;        // WIFSIGNALED
    bool success() const { return exited && code == 0; }
};

class ChildProcess {
public:
    ChildProcess();
    ~ChildProcess();
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // stdin/stdout/stderr become separate pipes.
    bool startWithPipes(const CommandSpec &cmd, std::string &err);
    // stdin/stdout/stderr all become the slave side of a new PTY.
    bool startWithPty(const CommandSpec &cmd, const WindowSize &ws,
                      std::string &err);

    pid_t pid() const { return pid_; }
    int stdinFd() const { return stdin_; }
    int stdoutFd() const { return stdout_; }
    int stderrFd() const { return stderr_; }
    int ptyFd() const { return pty_; }

    void closePty();
    // Hands the stdin descriptor to the caller, who must close it.
    int releaseStdin();

    // SIGKILL unless already reaped. Returns true if a signal was sent.
    bool kill();
    // Blocks until the child has been reaped (idempotent).
    ExitStatus wait();
    bool reaped() const;

private:
    bool spawn(const CommandSpec &cmd, bool usePty, const WindowSize &ws,
               std::string &err);

    pid_t pid_ = -1;
    int stdin_ = -1;
    int stdout_ = -1;
    int stderr_ = -1;
    int pty_ = -1;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool waiting_ = false;
    bool reaped_ = false;
    ExitStatus status_;
};

} // namespace termxfer

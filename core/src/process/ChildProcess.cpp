// Spawns transfer drivers. Exec failures are reported back through a
// close-on-exec status pipe so a missing or non-executable binary is an
// error of start*(), not a silent exit code 127.
#include "termxfer/ChildProcess.hpp"
#include "termxfer/Logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pty.h>
#include <sys/wait.h>
#include <unistd.h>

namespace termxfer {

namespace {

std::once_flag g_sigpipeOnce;

// Writes to a pipe whose reader died must fail with EPIPE instead of
// terminating the server.
void ignoreSigpipe() {
    std::call_once(g_sigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePair(int p[2]) {
    closeFd(p[0]);
    closeFd(p[1]);
}

} // namespace

ChildProcess::ChildProcess() = default;

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped()) {
        kill();
        wait();
    }
    closeFd(stdin_);
    closeFd(stdout_);
    closeFd(stderr_);
    closeFd(pty_);
}

bool ChildProcess::startWithPipes(const CommandSpec &cmd, std::string &err) {
    return spawn(cmd, false, WindowSize{}, err);
}

bool ChildProcess::startWithPty(const CommandSpec &cmd, const WindowSize &ws,
                                std::string &err) {
    return spawn(cmd, true, ws, err);
}

bool ChildProcess::spawn(const CommandSpec &cmd, bool usePty,
                         const WindowSize &ws, std::string &err) {
    ignoreSigpipe();
    if (pid_ != -1) {
        err = "process already started";
        return false;
    }
    if (cmd.program.empty()) {
        err = "empty program path";
        return false;
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argvStore;
    argvStore.reserve(cmd.args.size() + 1);
    argvStore.push_back(cmd.program);
    argvStore.insert(argvStore.end(), cmd.args.begin(), cmd.args.end());
    std::vector<char *> argv;
    argv.reserve(argvStore.size() + 1);
    for (auto &a : argvStore)
        argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);
    const char *cwd = cmd.workingDir.empty() ? nullptr : cmd.workingDir.c_str();

    int status[2] = {-1, -1};
    int in[2] = {-1, -1};
    int out[2] = {-1, -1};
    int errp[2] = {-1, -1};
    if (::pipe2(status, O_CLOEXEC) != 0) {
        err = std::string("pipe2: ") + std::strerror(errno);
        return false;
    }
    if (!usePty) {
        if (::pipe2(in, O_CLOEXEC) != 0 || ::pipe2(out, O_CLOEXEC) != 0 ||
            ::pipe2(errp, O_CLOEXEC) != 0) {
            err = std::string("pipe2: ") + std::strerror(errno);
            closePair(status);
            closePair(in);
            closePair(out);
            closePair(errp);
            return false;
        }
    }

    int master = -1;
    pid_t pid;
    if (usePty) {
        struct winsize w {};
        w.ws_row = ws.rows;
        w.ws_col = ws.cols;
        pid = ::forkpty(&master, nullptr, nullptr,
                        (ws.rows || ws.cols) ? &w : nullptr);
    } else {
        pid = ::fork();
    }
    if (pid < 0) {
        err = std::string(usePty ? "forkpty: " : "fork: ") +
              std::strerror(errno);
        closePair(status);
        closePair(in);
        closePair(out);
        closePair(errp);
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        if (!usePty) {
            if (::dup2(in[0], STDIN_FILENO) < 0 ||
                ::dup2(out[1], STDOUT_FILENO) < 0 ||
                ::dup2(errp[1], STDERR_FILENO) < 0) {
                const int e = errno;
                (void)!::write(status[1], &e, sizeof(e));
                ::_exit(127);
            }
        }
        if (cwd && ::chdir(cwd) != 0) {
            const int e = errno;
            (void)!::write(status[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execv(argv[0], argv.data());
        const int e = errno;
        (void)!::write(status[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Parent.
    closeFd(status[1]);
    closeFd(in[0]);
    closeFd(out[1]);
    closeFd(errp[1]);
    if (master >= 0)
        ::fcntl(master, F_SETFD, FD_CLOEXEC);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(status[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(status[0]);

    pid_ = pid;
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        wait();
        err = std::string("exec ") + cmd.program + ": " +
              std::strerror(childErrno);
        closePair(in);
        closePair(out);
        closePair(errp);
        if (master >= 0)
            ::close(master);
        return false;
    }

    stdin_ = in[1];
    stdout_ = out[0];
    stderr_ = errp[0];
    pty_ = master;
    qCDebug(txProcess) << "started pid" << pid << (usePty ? "on pty" : "on pipes");
    return true;
}

void ChildProcess::closePty() { closeFd(pty_); }

int ChildProcess::releaseStdin() {
    const int fd = stdin_;
    stdin_ = -1;
    return fd;
}

bool ChildProcess::kill() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (pid_ <= 0 || reaped_)
        return false;
    return ::kill(pid_, SIGKILL) == 0;
}

bool ChildProcess::reaped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reaped_;
}

ExitStatus ChildProcess::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (pid_ <= 0 || reaped_)
        return status_;
    if (waiting_) {
        cv_.wait(lk, [this] { return reaped_; });
        return status_;
    }
    waiting_ = true;
    const pid_t pid = pid_;
    lk.unlock();

    // Wait for exit but leave the zombie in place, so kill() cannot hit a
    // recycled pid while we are not holding the lock.
    siginfo_t info {};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    lk.lock();
    int st = 0;
    pid_t w;
    do {
        w = ::waitpid(pid, &st, 0);
    } while (w < 0 && errno == EINTR);
    if (w == pid) {
        if (WIFEXITED(st)) {
            status_.exited = true;
            status_.code = WEXITSTATUS(st);
        } else if (WIFSIGNALED(st)) {
            status_.signal = WTERMSIG(st);
        }
    } else {
        qCWarning(txProcess) << "waitpid" << pid << "failed:"
                             << std::strerror(errno);
    }
    reaped_ = true;
    waiting_ = false;
    cv_.notify_all();
    qCDebug(txProcess) << "reaped pid" << pid << "exited" << status_.exited
                       << "code" << status_.code << "signal" << status_.signal;
    return status_;
}

} // namespace termxfer

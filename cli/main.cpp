// termxfer: runs one protocol transfer over this process's stdin/stdout, for
// use as a door program or from a shell on the user's side of the link.
// Logging goes to stderr; stdout carries protocol bytes only.
#include "termxfer/FdSession.hpp"
#include "termxfer/ProtocolExecutor.hpp"
#include "termxfer/ProtocolRegistry.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <pthread.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

Q_LOGGING_CATEGORY(txCli, "termxfer.cli")

using namespace termxfer;

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitBinaryNotFound = 2;

// Raw mode on the controlling terminal for the duration of a transfer.
class RawTerminal {
public:
    explicit RawTerminal(int fd) : fd_(fd) {
        if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0)
            return;
        struct termios raw = saved_;
        ::cfmakeraw(&raw);
        active_ = ::tcsetattr(fd_, TCSANOW, &raw) == 0;
        if (!active_)
            qCWarning(txCli) << "could not switch terminal to raw mode";
    }
    ~RawTerminal() {
        if (active_)
            ::tcsetattr(fd_, TCSANOW, &saved_);
    }
    RawTerminal(const RawTerminal &) = delete;
    RawTerminal &operator=(const RawTerminal &) = delete;

private:
    int fd_;
    bool active_ = false;
    struct termios saved_ {};
};

PtyInfo localPty(int fd) {
    PtyInfo info;
    struct winsize ws {};
    if (!::isatty(fd) || ::ioctl(fd, TIOCGWINSZ, &ws) != 0)
        return info;
    info.hasPty = true;
    info.window.cols = ws.ws_col;
    info.window.rows = ws.ws_row;
    if (const char *term = std::getenv("TERM"))
        info.terminalType = term;
    return info;
}

sigset_t watchedSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGWINCH);
    return set;
}

// SIGTERM/SIGHUP cancel the transfer; SIGWINCH is forwarded as a resize.
// main() blocks these signals before any thread exists; they are consumed
// here with sigwait().
class SignalWatcher {
public:
    SignalWatcher(const CancelToken &cancel, FdSession &session)
        : cancel_(cancel), session_(session), set_(watchedSignals()) {
        thread_ = std::thread([this] { run(); });
    }
    ~SignalWatcher() {
        done_ = true;
        ::pthread_kill(thread_.native_handle(), SIGWINCH);
        thread_.join();
    }
    SignalWatcher(const SignalWatcher &) = delete;
    SignalWatcher &operator=(const SignalWatcher &) = delete;

private:
    void run() {
        for (;;) {
            int sig = 0;
            if (::sigwait(&set_, &sig) != 0)
                continue;
            if (done_)
                return;
            if (sig == SIGWINCH) {
                const PtyInfo info = localPty(STDIN_FILENO);
                if (info.hasPty)
                    session_.notifyResize(info.window);
                continue;
            }
            qCInfo(txCli) << "signal" << sig << "received; cancelling transfer";
            cancel_.cancel();
        }
    }

    CancelToken cancel_;
    FdSession &session_;
    sigset_t set_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

QString defaultProtocolsPath() {
    return QDir(QStandardPaths::writableLocation(
                    QStandardPaths::AppConfigLocation))
        .filePath(QStringLiteral("protocols.json"));
}

int listProtocols(const std::vector<ProtocolConfig> &protocols) {
    QTextStream out(stdout);
    const std::vector<ProtocolConfig> usable = availableProtocols(protocols);
    for (const auto &p : protocols) {
        const bool ok = std::any_of(usable.begin(), usable.end(),
                                    [&](const ProtocolConfig &u) {
                                        return u.key == p.key;
                                    });
        out << QString::fromStdString(p.key).leftJustified(4) << ' '
            << QString::fromStdString(p.name).leftJustified(24) << ' '
            << (ok ? "ok     " : "missing") << ' '
            << connectionRestrictionName(p.connectionRestriction)
            << (p.isDefault ? " (default)" : "") << '\n';
        if (!p.description.empty())
            out << "     " << QString::fromStdString(p.description) << '\n';
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[]) {
    const sigset_t watched = watchedSignals();
    ::pthread_sigmask(SIG_BLOCK, &watched, nullptr);

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("termxfer"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Run an external file transfer protocol over stdio."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list, send or recv"));
    parser.addPositionalArgument(
        QStringLiteral("args"),
        QStringLiteral("send: files to send; recv: upload directory"),
        QStringLiteral("[args...]"));
    const QCommandLineOption protocolsOpt(
        {QStringLiteral("p"), QStringLiteral("protocols")},
        QStringLiteral("Protocol definitions file."), QStringLiteral("file"),
        defaultProtocolsPath());
    const QCommandLineOption keyOpt({QStringLiteral("k"), QStringLiteral("key")},
                                    QStringLiteral("Protocol key to use."),
                                    QStringLiteral("key"));
    const QCommandLineOption timeoutOpt(
        {QStringLiteral("t"), QStringLiteral("timeout")},
        QStringLiteral("Abort the transfer after this many seconds."),
        QStringLiteral("seconds"));
    // -v is taken by --version.
    const QCommandLineOption verboseOpt(
        QStringLiteral("verbose"),
        QStringLiteral("Enable debug logging on stderr."));
    parser.addOptions({protocolsOpt, keyOpt, timeoutOpt, verboseOpt});
    parser.process(app);

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules(QStringLiteral("termxfer.*.debug=true"));

    QTextStream err(stderr);
    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err << parser.helpText();
        return kExitFailure;
    }
    const QString command = positional.first();

    std::vector<ProtocolConfig> protocols;
    BridgeTimings timings;
    std::string loadErr;
    if (!loadProtocols(parser.value(protocolsOpt).toStdString(), protocols,
                       loadErr, &timings)) {
        err << "termxfer: " << QString::fromStdString(loadErr) << '\n';
        return kExitFailure;
    }

    if (command == QLatin1String("list"))
        return listProtocols(protocols);

    if (command != QLatin1String("send") && command != QLatin1String("recv")) {
        err << "termxfer: unknown command " << command << '\n';
        return kExitFailure;
    }

    ProtocolConfig protocol;
    if (parser.isSet(keyOpt)) {
        bool found = false;
        protocol = findProtocol(protocols, parser.value(keyOpt).toStdString(),
                                found);
        if (!found) {
            err << "termxfer: no protocol with key " << parser.value(keyOpt)
                << '\n';
            return kExitFailure;
        }
    } else {
        bool ok = false;
        protocol = defaultProtocol(protocols, ok);
        if (!ok) {
            err << "termxfer: no protocols configured\n";
            return kExitFailure;
        }
    }

    const QStringList args = positional.mid(1);
    std::vector<std::string> files;
    std::string targetDir;
    if (command == QLatin1String("send")) {
        if (args.isEmpty()) {
            err << "termxfer: send needs at least one file\n";
            return kExitFailure;
        }
        for (const QString &a : args) {
            const QFileInfo fi(a);
            if (!fi.isFile()) {
                err << "termxfer: not a file: " << a << '\n';
                return kExitFailure;
            }
            files.push_back(fi.absoluteFilePath().toStdString());
        }
    } else {
        if (args.size() != 1 || !QFileInfo(args.first()).isDir()) {
            err << "termxfer: recv needs one existing directory\n";
            return kExitFailure;
        }
        targetDir = QFileInfo(args.first()).absoluteFilePath().toStdString();
    }

    CancelToken cancel;
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        const int seconds = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || seconds <= 0) {
            err << "termxfer: invalid timeout " << parser.value(timeoutOpt)
                << '\n';
            return kExitFailure;
        }
        cancel = CancelToken::withTimeout(std::chrono::seconds(seconds));
    }

    FdSession session(STDIN_FILENO, STDOUT_FILENO);
    session.setPty(localPty(STDIN_FILENO));

    TransferResult result;
    {
        SignalWatcher watcher(cancel, session);
        RawTerminal raw(STDIN_FILENO);
        if (command == QLatin1String("send"))
            executeSend(cancel, session, protocol, files, result, timings);
        else
            executeReceive(cancel, session, protocol, targetDir, result,
                           timings);
    }

    if (result.ok())
        return EXIT_SUCCESS;
    err << "termxfer: " << transferErrorName(result.error) << ": "
        << QString::fromStdString(result.message) << '\n';
    return result.error == TransferError::BinaryNotFound ? kExitBinaryNotFound
                                                         : kExitFailure;
}

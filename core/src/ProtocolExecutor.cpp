#include "termxfer/ProtocolExecutor.hpp"
#include "termxfer/ArgExpander.hpp"
#include "termxfer/Logging.hpp"
#include "termxfer/ProtocolRegistry.hpp"
#include "termxfer/RuntimeLogging.hpp"
#include "termxfer/TransportBridge.hpp"

#include <QFile>
#include <QString>

namespace termxfer {

namespace {

bool isAbsolutePath(const std::string &p) { return !p.empty() && p[0] == '/'; }

bool fail(TransferResult &result, TransferError code, std::string message) {
    result = TransferResult{};
    result.error = code;
    result.message = std::move(message);
    qCWarning(txBridge) << transferErrorName(code)
                        << QString::fromStdString(result.message);
    return false;
}

bool runBridge(const CancelToken &cancel, Session &session,
               const ProtocolConfig &protocol, const CommandSpec &cmd,
               const BridgeOptions &opt, const std::string &fileListPath,
               TransferResult &result) {
    const bool ok = protocol.requiresPty
                        ? runWithPty(cancel, session, cmd, opt, result)
                        : runDirect(cancel, session, cmd, opt, result);
    if (!fileListPath.empty() &&
        !QFile::remove(QString::fromStdString(fileListPath))) {
        qCWarning(txBridge) << "could not remove file list"
                            << QString::fromStdString(
                                   describePath(fileListPath));
    }
    return ok;
}

} // namespace

bool executeSend(const CancelToken &cancel, Session &session,
                 const ProtocolConfig &protocol,
                 const std::vector<std::string> &filePaths,
                 TransferResult &result, const BridgeTimings &timings) {
    if (filePaths.empty())
        return fail(result, TransferError::InvalidInput, "no files to send");
    for (const auto &p : filePaths) {
        if (!isAbsolutePath(p)) {
            return fail(result, TransferError::InvalidInput,
                        "file path is not absolute: " + describePath(p));
        }
    }
    if (filePaths.size() > 1 && !protocol.supportsBatch) {
        return fail(result, TransferError::InvalidInput,
                    "protocol " + protocol.name +
                        " cannot send more than one file at a time");
    }

    std::string program;
    if (!resolveExecutable(protocol.sendCommand, program)) {
        return fail(result, TransferError::BinaryNotFound,
                    "send command '" + protocol.sendCommand +
                        "' not found in PATH");
    }

    ExpandedArgs expanded = expandArgs(protocol.sendArgs, filePaths, "");
    CommandSpec cmd;
    cmd.program = program;
    cmd.args = std::move(expanded.args);

    BridgeOptions opt;
    opt.timings = timings;
    qCInfo(txBridge) << "sending" << static_cast<qulonglong>(filePaths.size())
                     << "file(s) with" << QString::fromStdString(protocol.name)
                     << (protocol.requiresPty ? "(pty)" : "(direct)");
    return runBridge(cancel, session, protocol, cmd, opt,
                     expanded.fileListPath, result);
}

bool executeReceive(const CancelToken &cancel, Session &session,
                    const ProtocolConfig &protocol,
                    const std::string &targetDir, TransferResult &result,
                    const BridgeTimings &timings) {
    if (targetDir.empty())
        return fail(result, TransferError::InvalidInput,
                    "no target directory for upload");
    if (!isAbsolutePath(targetDir)) {
        return fail(result, TransferError::InvalidInput,
                    "target directory is not absolute: " +
                        describePath(targetDir));
    }

    std::string program;
    if (!resolveExecutable(protocol.recvCommand, program)) {
        return fail(result, TransferError::BinaryNotFound,
                    "receive command '" + protocol.recvCommand +
                        "' not found in PATH");
    }

    ExpandedArgs expanded = expandArgs(protocol.recvArgs, {}, targetDir);
    CommandSpec cmd;
    cmd.program = program;
    cmd.args = std::move(expanded.args);
    cmd.workingDir = targetDir;

    BridgeOptions opt;
    opt.timings = timings;
    opt.idleTimeout = protocol.recvIdleTimeout;
    qCInfo(txBridge) << "receiving into"
                     << QString::fromStdString(describePath(targetDir))
                     << "with" << QString::fromStdString(protocol.name)
                     << (protocol.requiresPty ? "(pty)" : "(direct)");
    return runBridge(cancel, session, protocol, cmd, opt,
                     expanded.fileListPath, result);
}

} // namespace termxfer

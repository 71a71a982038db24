// Registry, argument expansion and executor validation tests (run via CTest).
#include "termxfer/ArgExpander.hpp"
#include "termxfer/FdSession.hpp"
#include "termxfer/ProtocolExecutor.hpp"
#include "termxfer/ProtocolRegistry.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

using namespace termxfer;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

std::string readFile(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

// Everything the peer end has received so far.
std::string readAvailable(int fd, int quietMs = 100) {
    std::string out;
    char buf[4096];
    for (;;) {
        struct pollfd p = {fd, POLLIN, 0};
        const int rc = ::poll(&p, 1, quietMs);
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc <= 0)
            break;
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0)
            break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

BridgeTimings fastTimings() {
    BridgeTimings t;
    t.postOutputGrace = std::chrono::milliseconds(1000);
    t.inputJoinTimeout = std::chrono::milliseconds(500);
    t.drainPause = std::chrono::milliseconds(10);
    t.drainWindow = std::chrono::milliseconds(50);
    t.ptyOutputFlush = std::chrono::milliseconds(300);
    return t;
}

ProtocolConfig shellProtocol() {
    ProtocolConfig p;
    p.key = "T";
    p.name = "Test";
    p.sendCommand = "sh";
    p.recvCommand = "sh";
    return p;
}

void test_builtin_defaults(TestContext &t) {
    const auto list = builtinProtocols();
    t.check(list.size() == 1, "built-in list should hold one protocol");
    if (list.empty())
        return;
    const ProtocolConfig &z = list.front();
    t.check(z.key == "Z", "built-in key should be Z");
    t.check(z.sendCommand == "sz" && z.recvCommand == "rz",
            "built-in protocol should use lrzsz");
    t.check(z.sendArgs == std::vector<std::string>({"-b", "-e"}),
            "built-in send args should be -b -e");
    t.check(z.recvArgs == std::vector<std::string>({"-b", "-r"}),
            "built-in recv args should be -b -r");
    t.check(z.supportsBatch && z.requiresPty && z.isDefault,
            "built-in protocol should be batch, pty and default");
    t.check(z.recvIdleTimeout.count() == 0,
            "lrzsz should not get an idle timeout");
}

void test_parse_array(TestContext &t) {
    const std::string json = R"([
      {"key": "Z", "name": "Zmodem", "description": "sexyz zmodem",
       "send_cmd": "sexyz", "send_args": ["-raw", "sz", "@{fileListPath}"],
       "recv_cmd": "/opt/sbbs/exec/SEXYZ", "recv_args": ["-raw", "rz", "{targetDir}"],
       "batch_send": true, "use_pty": false, "default": true},
      {"key": "x", "name": "Xmodem", "send_cmd": "sx", "recv_cmd": "rx",
       "connection_type": "telnet"},
      {"key": "K", "name": "Kermit", "send_cmd": "kermit", "recv_cmd": "sexyz",
       "recv_idle_timeout_ms": 0, "connection_type": "SSH"}
    ])";
    std::vector<ProtocolConfig> list;
    std::string err;
    t.check(parseProtocols(json, list, err), "valid array should parse: " + err);
    t.check(list.size() == 3, "three protocols expected");
    if (list.size() != 3)
        return;
    t.check(list[0].sendArgs.size() == 3 && list[0].sendArgs[2] == "@{fileListPath}",
            "send_args should be kept verbatim");
    t.check(list[0].supportsBatch && !list[0].requiresPty && list[0].isDefault,
            "boolean fields should be read");
    t.check(list[0].recvIdleTimeout == kKnownDriverRecvIdleTimeout,
            "SEXYZ receive should get the known-driver idle timeout");
    t.check(list[1].recvIdleTimeout.count() == 0,
            "other drivers get no idle timeout");
    t.check(list[1].connectionRestriction == ConnectionRestriction::TelnetOnly,
            "connection_type telnet should parse");
    t.check(!list[1].supportsBatch && !list[1].isDefault,
            "missing booleans default to false");
    t.check(list[2].connectionRestriction == ConnectionRestriction::SshOnly,
            "connection_type is case-insensitive");
    t.check(list[2].recvIdleTimeout.count() == 0,
            "explicit recv_idle_timeout_ms overrides the sexyz default");
}

void test_parse_object_with_timings(TestContext &t) {
    const std::string json = R"({
      "protocols": [{"key": "Z", "name": "Zmodem", "send_cmd": "sz",
                     "recv_cmd": "rz", "recv_idle_timeout_ms": 7000}],
      "timings": {"post_output_grace_ms": 3000, "drain_window_ms": 900}
    })";
    std::vector<ProtocolConfig> list;
    BridgeTimings timings;
    std::string err;
    t.check(parseProtocols(json, list, err, &timings),
            "object form should parse: " + err);
    t.check(list.size() == 1 && list[0].recvIdleTimeout.count() == 7000,
            "recv_idle_timeout_ms should be read");
    t.check(timings.postOutputGrace.count() == 3000,
            "post_output_grace_ms should override");
    t.check(timings.drainWindow.count() == 900, "drain_window_ms should override");
    t.check(timings.inputJoinTimeout.count() == 2000,
            "unspecified timings keep their defaults");
}

void test_parse_errors(TestContext &t) {
    struct Case {
        const char *json;
        const char *needle;
    };
    const Case cases[] = {
        {"[{\"key\": \"Z\"", "invalid JSON"},
        {"42", ""}, // Qt versions differ on scalar documents
        {"[1]", "not an object"},
        {"[{\"key\": 5}]", "'key' must be a string"},
        {"[{\"key\": \"Z\", \"send_args\": \"-b\"}]", "send_args"},
        {"[{\"key\": \"Z\", \"use_pty\": \"yes\"}]", "use_pty"},
        {"[{\"key\": \"Z\"}, {\"key\": \"z\"}]", "duplicate"},
        {"[{\"key\": \"Z\", \"connection_type\": \"rlogin\"}]", "connection_type"},
        {"[{\"key\": \"Z\", \"recv_idle_timeout_ms\": -1}]", "non-negative"},
        {"[{\"key\": \"Z\", \"recv_idle_timeout_ms\": 1e300}]", "86400000"},
        {"[{\"key\": \"Z\", \"recv_idle_timeout_ms\": 86400001}]", "at most"},
        {"{\"protocols\": [], \"timings\": {\"post_output_grace_ms\": 1e19}}",
         "post_output_grace_ms"},
        {"{\"protocols\": {}}", "'protocols' must be an array"},
        {"{\"protocols\": [], \"timings\": 3}", "'timings' must be an object"},
    };
    for (const auto &c : cases) {
        std::vector<ProtocolConfig> list = builtinProtocols();
        std::string err;
        t.check(!parseProtocols(c.json, list, err),
                std::string("should reject: ") + c.json);
        t.checkContains(err, c.needle,
                        std::string("error for ") + c.json + " was: " + err);
        t.check(list.size() == 1, "output must be untouched on error");
    }
}

void test_load_file(TestContext &t) {
    QTemporaryDir dir;
    t.check(dir.isValid(), "temp dir should be created");
    std::vector<ProtocolConfig> list;
    std::string err;

    const std::string missing = dir.filePath("nope.json").toStdString();
    t.check(loadProtocols(missing, list, err),
            "missing protocols file is not an error");
    t.check(list.size() == 1 && list[0].key == "Z",
            "missing file should yield the built-in list");

    const QString path = dir.filePath("protocols.json");
    QFile f(path);
    t.check(f.open(QIODevice::WriteOnly), "write protocols file");
    f.write(R"([{"key": "Y", "name": "Ymodem", "send_cmd": "sb", "recv_cmd": "rb"}])");
    f.close();
    t.check(loadProtocols(path.toStdString(), list, err),
            "existing file should load: " + err);
    t.check(list.size() == 1 && list[0].key == "Y", "file contents should load");

    QFile bad(dir.filePath("bad.json"));
    t.check(bad.open(QIODevice::WriteOnly), "write bad file");
    bad.write("{not json");
    bad.close();
    err.clear();
    t.check(!loadProtocols(bad.fileName().toStdString(), list, err),
            "malformed file should fail");
    t.checkContains(err, "bad.json", "error should name the file");
}

void test_default_and_lookup(TestContext &t) {
    std::vector<ProtocolConfig> list(3);
    list[0].key = "X";
    list[1].key = "Z";
    list[1].isDefault = true;
    list[2].key = "k";

    bool ok = false;
    t.check(defaultProtocol(list, ok).key == "Z" && ok,
            "flagged entry should be the default");
    list[1].isDefault = false;
    t.check(defaultProtocol(list, ok).key == "X",
            "first entry is the default when none is flagged");
    defaultProtocol({}, ok);
    t.check(!ok, "empty list has no default");

    bool found = false;
    t.check(findProtocol(list, "K", found).key == "k" && found,
            "lookup should be case-insensitive");
    const ProtocolConfig fallback = findProtocol(list, "Q", found);
    t.check(!found, "unknown key should report not found");
    t.check(fallback.key == "X", "unknown key should fall back to the default");
}

void test_connection_filter(TestContext &t) {
    std::vector<ProtocolConfig> list(3);
    list[0].key = "A";
    list[1].key = "S";
    list[1].connectionRestriction = ConnectionRestriction::SshOnly;
    list[2].key = "T";
    list[2].connectionRestriction = ConnectionRestriction::TelnetOnly;

    t.check(isAvailableFor(list[0], ConnectionKind::Telnet),
            "unrestricted protocol is available everywhere");
    t.check(!isAvailableFor(list[1], ConnectionKind::Telnet),
            "ssh-only protocol is hidden on telnet");
    t.check(!isAvailableFor(list[2], ConnectionKind::Unknown),
            "restricted protocols need a known connection kind");
    const auto ssh = protocolsForConnection(list, ConnectionKind::Ssh);
    t.check(ssh.size() == 2 && ssh[0].key == "A" && ssh[1].key == "S",
            "ssh view should keep order and drop telnet-only entries");
    t.check(std::string(connectionRestrictionName(
                ConnectionRestriction::TelnetOnly)) == "telnet",
            "restriction name should match the JSON value");
}

void test_resolve_executable(TestContext &t) {
    std::string resolved;
    t.check(resolveExecutable("sh", resolved), "sh should be on PATH");
    t.check(!resolved.empty() && resolved[0] == '/',
            "resolved path should be absolute");
    t.check(resolveExecutable("/bin/sh", resolved) && resolved == "/bin/sh",
            "absolute path should be accepted as is");
    t.check(!resolveExecutable("termxfer-no-such-driver", resolved),
            "missing driver should not resolve");
    t.check(!resolveExecutable("/etc/passwd", resolved),
            "non-executable file should not resolve");
    t.check(!resolveExecutable("", resolved), "empty command should not resolve");

    std::vector<ProtocolConfig> list(2);
    list[0].key = "S";
    list[0].sendCommand = "sh";
    list[0].recvCommand = "sh";
    list[1].key = "M";
    list[1].sendCommand = "sh";
    list[1].recvCommand = "termxfer-no-such-driver";
    const auto usable = availableProtocols(list);
    t.check(usable.size() == 1 && usable[0].key == "S",
            "protocol with a missing driver should be filtered");
}

void test_expand_file_path(TestContext &t) {
    const std::vector<std::string> files = {"/a/one.zip", "/b/two.zip"};

    auto e = expandArgs({"-b", "{filePath}"}, files, "");
    t.check(e.args == std::vector<std::string>({"-b", "/a/one.zip", "/b/two.zip"}),
            "standalone {filePath} expands to every file");
    t.check(e.fileListPath.empty(), "no file list without {fileListPath}");

    e = expandArgs({"--file={filePath}"}, files, "");
    t.check(e.args == std::vector<std::string>({"--file=/a/one.zip"}),
            "inline {filePath} takes the first file only and suppresses the append");

    e = expandArgs({"-b", "-e"}, files, "");
    t.check(e.args ==
                std::vector<std::string>({"-b", "-e", "/a/one.zip", "/b/two.zip"}),
            "files are appended when no placeholder is used");

    e = expandArgs({"-x"}, {}, "");
    t.check(e.args == std::vector<std::string>({"-x"}),
            "nothing is appended without files");
}

void test_expand_target_dir(TestContext &t) {
    auto e = expandArgs({"rz", "{targetDir}"}, {}, "/srv/uploads");
    t.check(e.args == std::vector<std::string>({"rz", "/srv/uploads/"}),
            "target dir gets a trailing separator");
    e = expandArgs({"--dir={targetDir}"}, {}, "/srv/uploads/");
    t.check(e.args == std::vector<std::string>({"--dir=/srv/uploads/"}),
            "existing separator is not doubled");
    e = expandArgs({"{targetDir}"}, {}, "");
    t.check(e.args == std::vector<std::string>({""}),
            "empty target dir expands to an empty argument");
}

void test_expand_file_list(TestContext &t) {
    const std::vector<std::string> files = {"/a/one.zip", "/b/two.zip"};

    auto e = expandArgs({"-raw", "sz", "@{fileListPath}"}, files, "");
    t.check(!e.fileListPath.empty(), "inline {fileListPath} writes a list");
    t.check(e.args.size() == 3 && e.args[2] == "@" + e.fileListPath,
            "inline {fileListPath} is replaced in place");
    t.checkContains(e.fileListPath, "termxfer-filelist-",
                    "list file should use the termxfer prefix");
    t.check(readFile(e.fileListPath) == "/a/one.zip\n/b/two.zip\n",
            "list should hold one path per line");
    t.check(e.args.size() == 3, "no append when the list is used");
    QFile::remove(QString::fromStdString(e.fileListPath));

    e = expandArgs({"{fileListPath}", "{fileListPath}"}, files, "");
    t.check(e.args.size() == 2 && e.args[0] == e.fileListPath &&
                e.args[1] == e.fileListPath,
            "one list per expansion, reused by every placeholder");
    QFile::remove(QString::fromStdString(e.fileListPath));

    e = expandArgs({"{fileListPath}"}, {}, "");
    t.check(e.args == std::vector<std::string>({""}) && e.fileListPath.empty(),
            "standalone {fileListPath} without files is an empty argument");

    e = expandArgs({"@{fileListPath}"}, {}, "");
    t.check(e.args == std::vector<std::string>({"@{fileListPath}"}),
            "inline {fileListPath} stays literal without files");
}

void test_send_validation(TestContext &t) {
    FdSession session(-1, -1);
    CancelToken cancel;
    TransferResult r;
    ProtocolConfig p = shellProtocol();

    t.check(!executeSend(cancel, session, p, {}, r) &&
                r.error == TransferError::InvalidInput,
            "empty file list should be InvalidInput");
    t.check(!executeSend(cancel, session, p, {"relative.txt"}, r) &&
                r.error == TransferError::InvalidInput,
            "relative path should be InvalidInput");
    t.check(!executeSend(cancel, session, p, {"/a", "/b"}, r) &&
                r.error == TransferError::InvalidInput,
            "several files need a batch protocol");
    t.checkContains(r.message, "more than one file", "batch error message");

    p.sendCommand = "termxfer-no-such-driver";
    t.check(!executeSend(cancel, session, p, {"/a"}, r) &&
                r.error == TransferError::BinaryNotFound,
            "missing send driver should be BinaryNotFound");
    t.checkContains(r.message, "termxfer-no-such-driver",
                    "binary-not-found message should name the command");
}

void test_receive_validation(TestContext &t) {
    FdSession session(-1, -1);
    CancelToken cancel;
    TransferResult r;
    ProtocolConfig p = shellProtocol();

    t.check(!executeReceive(cancel, session, p, "", r) &&
                r.error == TransferError::InvalidInput,
            "empty target dir should be InvalidInput");
    t.check(!executeReceive(cancel, session, p, "uploads", r) &&
                r.error == TransferError::InvalidInput,
            "relative target dir should be InvalidInput");
    p.recvCommand = "termxfer-no-such-driver";
    t.check(!executeReceive(cancel, session, p, "/tmp", r) &&
                r.error == TransferError::BinaryNotFound,
            "missing receive driver should be BinaryNotFound");
}

void test_send_runs_driver_and_removes_list(TestContext &t) {
    int sv[2];
    t.check(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0,
            "socketpair");
    FdSession session(sv[0], sv[0], true);

    QTemporaryDir dir;
    const std::string a = dir.filePath("a.txt").toStdString();
    const std::string b = dir.filePath("b.txt").toStdString();

    ProtocolConfig p = shellProtocol();
    p.supportsBatch = true;
    // $0 is "@<list>": print the list path, then the list itself.
    p.sendArgs = {"-c", "l=${0#@}; printf '%s\\n' \"$l\"; cat \"$l\"",
                  "@{fileListPath}"};

    CancelToken cancel;
    TransferResult r;
    t.check(executeSend(cancel, session, p, {a, b}, r, fastTimings()),
            "send through sh should succeed: " + r.message);
    const std::string out = readAvailable(sv[1]);
    const std::size_t nl = out.find('\n');
    t.check(nl != std::string::npos, "driver should print the list path");
    if (nl != std::string::npos) {
        const std::string listPath = out.substr(0, nl);
        t.check(out.substr(nl + 1) == a + "\n" + b + "\n",
                "driver should see both files in the list");
        t.check(!QFileInfo::exists(QString::fromStdString(listPath)),
                "file list should be removed after the transfer");
    }
    ::close(sv[1]);
}

void test_receive_uses_target_dir(TestContext &t) {
    int sv[2];
    t.check(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == 0,
            "socketpair");
    FdSession session(sv[0], sv[0], true);
    QTemporaryDir dir;

    ProtocolConfig p = shellProtocol();
    p.recvArgs = {"-c", "pwd > cwd.txt; printf x > \"$0\"got.bin", "{targetDir}"};

    CancelToken cancel;
    TransferResult r;
    t.check(executeReceive(cancel, session, p, dir.path().toStdString(), r,
                           fastTimings()),
            "receive through sh should succeed: " + r.message);
    t.check(readFile(dir.filePath("got.bin").toStdString()) == "x",
            "{targetDir} should point at the upload directory");
    const std::string cwd = readFile(dir.filePath("cwd.txt").toStdString());
    t.check(QDir(QString::fromStdString(cwd).trimmed()).canonicalPath() ==
                QDir(dir.path()).canonicalPath(),
            "driver should run inside the upload directory");
    ::close(sv[1]);
}

} // namespace

int main() {
    TestContext t;
    test_builtin_defaults(t);
    test_parse_array(t);
    test_parse_object_with_timings(t);
    test_parse_errors(t);
    test_load_file(t);
    test_default_and_lookup(t);
    test_connection_filter(t);
    test_resolve_executable(t);
    test_expand_file_path(t);
    test_expand_target_dir(t);
    test_expand_file_list(t);
    test_send_validation(t);
    test_receive_validation(t);
    test_send_runs_driver_and_removes_list(t);
    test_receive_uses_target_dir(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] termxfer_protocol_tests\n";
    return EXIT_SUCCESS;
}

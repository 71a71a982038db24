// Integration tests for Libssh2ChannelSession driving a local transfer
// process against a real SSH server. The test is skipped (exit code 77)
// unless the required TERMXFER_IT_SSH_* env vars exist.
#include "termxfer/Libssh2ChannelSession.hpp"
#include "termxfer/TransportBridge.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace termxfer;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

CommandSpec shell(const std::string &script) {
    CommandSpec c;
    c.program = "/bin/sh";
    c.args = {"-c", script};
    return c;
}

BridgeOptions itOptions() {
    BridgeOptions o;
    o.idleTimeout = std::chrono::milliseconds(10000);
    return o;
}

// Remote output lands in a local file through the driver's stdin.
void test_receive_from_remote(TestContext &t, const SshTarget &target,
                              const fs::path &dir, const std::string &token) {
    Libssh2ChannelSession ssh;
    std::string err;
    if (!ssh.connect(target, err)) {
        t.check(false, "connect failed: " + err);
        return;
    }
    const std::string payload = "termxfer-it-" + token;
    if (!ssh.openExec("printf '%s' '" + payload + "'", false, err)) {
        t.check(false, "openExec failed: " + err);
        return;
    }
    const fs::path out = dir / "received.txt";
    TransferResult r;
    runDirect(CancelToken::withTimeout(std::chrono::seconds(30)), ssh,
              shell("cat > '" + out.string() + "'"), itOptions(), r);
    t.check(r.ok(), "receive over ssh should succeed: " + r.message);

    std::string got;
    t.check(readFile(out, got), "received file exists");
    t.check(got == payload, "received payload matches remote output");
    t.check(ssh.closeChannel() == 0, "remote command exit status is 0");
    ssh.disconnect();
}

// Driver output reaches the remote command and its echo comes back.
void test_round_trip(TestContext &t, const SshTarget &target,
                     const fs::path &dir) {
    Libssh2ChannelSession ssh;
    std::string err;
    if (!ssh.connect(target, err)) {
        t.check(false, "connect failed: " + err);
        return;
    }
    if (!ssh.openExec("head -c 4", false, err)) {
        t.check(false, "openExec failed: " + err);
        return;
    }
    const fs::path out = dir / "echo.txt";
    TransferResult r;
    runDirect(CancelToken::withTimeout(std::chrono::seconds(30)), ssh,
              shell("printf ping; cat > '" + out.string() + "'"), itOptions(),
              r);
    t.check(r.ok(), "round trip over ssh should succeed: " + r.message);
    std::string got;
    t.check(readFile(out, got) && got == "ping",
            "remote echo reaches the driver");
    ssh.closeChannel();
    ssh.disconnect();
}

} // namespace

int main() {
    const auto host = envValue("TERMXFER_IT_SSH_HOST");
    const auto user = envValue("TERMXFER_IT_SSH_USER");
    const auto pass = envValue("TERMXFER_IT_SSH_PASS");
    const auto keyPath = envValue("TERMXFER_IT_SSH_KEY");
    const auto keyPassphrase = envValue("TERMXFER_IT_SSH_KEY_PASSPHRASE");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] termxfer_ssh_integration_tests requires env vars: "
                  << "TERMXFER_IT_SSH_HOST, TERMXFER_IT_SSH_USER and one "
                     "auth method "
                  << "(TERMXFER_IT_SSH_PASS or TERMXFER_IT_SSH_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] TERMXFER_IT_SSH_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("TERMXFER_IT_SSH_PORT"), port)) {
        std::cerr << "[FAIL] TERMXFER_IT_SSH_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    SshTarget target;
    target.host = *host;
    target.port = port;
    target.username = *user;
    if (pass.has_value())
        target.password = *pass;
    if (keyPath.has_value()) {
        target.privateKeyPath = *keyPath;
        if (keyPassphrase.has_value())
            target.privateKeyPassphrase = *keyPassphrase;
    }
    target.knownHostsPolicy = KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("termxfer-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    test_receive_from_remote(t, target, localTmpRoot, token);
    test_round_trip(t, target, localTmpRoot);

    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] termxfer_ssh_integration_tests\n";
    return EXIT_SUCCESS;
}

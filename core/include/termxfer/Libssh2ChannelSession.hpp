// Session over an SSH client channel (libssh2): runs one remote command and
// exposes its stdin/stdout as the session stream. Used to drive a transfer
// against a remote host and by the SSH integration test.
#pragma once
#include "Session.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_CHANNEL;

namespace termxfer {

enum class KnownHostsPolicy {
    Strict, // host key must match known_hosts
    Off     // no verification (tests only)
};

struct SshTarget {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> privateKeyPath;
    std::optional<std::string> privateKeyPassphrase;

    std::optional<std::string> knownHostsPath; // default: ~/.ssh/known_hosts
    KnownHostsPolicy knownHostsPolicy = KnownHostsPolicy::Strict;
};

class Libssh2ChannelSession : public Session {
public:
    Libssh2ChannelSession();
    ~Libssh2ChannelSession() override;
    Libssh2ChannelSession(const Libssh2ChannelSession &) = delete;
    Libssh2ChannelSession &operator=(const Libssh2ChannelSession &) = delete;

    bool connect(const SshTarget &target, std::string &err);
    // Starts `command` remotely. Remote stderr is discarded so it can never
    // interleave with protocol bytes.
    bool openExec(const std::string &command, bool requestPty,
                  std::string &err);
    // Closes the channel and returns the remote exit status (-1 if unknown).
    int closeChannel();
    void disconnect();

    IoResult read(char *buf, std::size_t len,
                  ReadInterrupt *interrupt) override;
    IoResult write(const char *data, std::size_t len,
                   ReadInterrupt *interrupt) override;
    bool supportsReadInterrupt() const override { return true; }
    ConnectionKind connectionKind() const override { return ConnectionKind::Ssh; }

private:
    bool tcpConnect(const std::string &host, std::uint16_t port,
                    std::string &err);
    bool handshake(const SshTarget &target, std::string &err);
    bool verifyHostKey(const SshTarget &target, std::string &err);
    bool authenticate(const SshTarget &target, std::string &err);
    std::string lastError() const;
    // Waits for the socket in the direction libssh2 is blocked on.
    void waitSocket(int extraFd, int timeoutMs, bool &extraReady) const;

    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_CHANNEL *channel_ = nullptr;
    // libssh2 sessions are not thread-safe; read and write run on different
    // bridge threads.
    mutable std::mutex mtx_;
};

} // namespace termxfer

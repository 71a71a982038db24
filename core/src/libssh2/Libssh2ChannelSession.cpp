// libssh2 backend: TCP socket, SSH session and one exec channel.
// Handshake and authentication run blocking; once the command is started the
// session switches to non-blocking mode so reads can be interrupted.
#include "termxfer/Libssh2ChannelSession.hpp"
#include "termxfer/Logging.hpp"
#include "termxfer/ReadInterrupt.hpp"
#include "termxfer/RuntimeLogging.hpp"

#include <libssh2.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace termxfer {

namespace {

std::once_flag g_libssh2Once;

// Upper bound for one socket wait. The other bridge thread may pull our
// packet into libssh2's buffer while we sit in poll(), so waits are sliced.
constexpr int kPollSliceMs = 100;

int knownHostAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

} // namespace

Libssh2ChannelSession::Libssh2ChannelSession() {
    std::call_once(g_libssh2Once, [] {
        if (libssh2_init(0) != 0)
            qCWarning(txSsh) << "libssh2_init failed";
    });
}

Libssh2ChannelSession::~Libssh2ChannelSession() { disconnect(); }

bool Libssh2ChannelSession::tcpConnect(const std::string &host,
                                       std::uint16_t port, std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + ::gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC,
                               rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
        // Protocol frames are small and latency-bound.
        ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            ::freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err = "could not connect to " + host + ":" + std::to_string(port);
    return false;
}

std::string Libssh2ChannelSession::lastError() const {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string("unknown libssh2 error");
}

bool Libssh2ChannelSession::verifyHostKey(const SshTarget &target,
                                          std::string &err) {
    if (target.knownHostsPolicy == KnownHostsPolicy::Off) {
        qCWarning(txSsh) << "host key verification disabled for"
                         << QString::fromStdString(target.host);
        return true;
    }
    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (target.knownHostsPath.has_value()) {
        khPath = *target.knownHostsPath;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    if (khPath.empty() ||
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable";
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "could not obtain host key";
        return false;
    }

    const int alg = knownHostAlg(keytype);
    const int plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                      LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int hashed = LIBSSH2_KNOWNHOST_TYPE_SHA1 |
                       LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, target.host.c_str(), target.port,
                                         hostkey, keylen, plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, target.host.c_str(), target.port,
                                         hostkey, keylen, hashed, &host);
    }
    libssh2_knownhost_free(nh);
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "host key does not match known_hosts"
              : "host not found in known_hosts";
    return false;
}

bool Libssh2ChannelSession::authenticate(const SshTarget &target,
                                         std::string &err) {
    // Explicit key first, then password, then ssh-agent.
    if (target.privateKeyPath.has_value()) {
        const char *passphrase = target.privateKeyPassphrase
                                     ? target.privateKeyPassphrase->c_str()
                                     : nullptr;
        if (libssh2_userauth_publickey_fromfile(
                session_, target.username.c_str(), nullptr,
                target.privateKeyPath->c_str(), passphrase) != 0) {
            err = "public key authentication failed: " + lastError();
            return false;
        }
        return true;
    }
    if (target.password.has_value()) {
        if (libssh2_userauth_password(session_, target.username.c_str(),
                                      target.password->c_str()) != 0) {
            err = "password authentication failed: " + lastError();
            return false;
        }
        return true;
    }

    const char *methods =
        libssh2_userauth_list(session_, target.username.c_str(),
                              static_cast<unsigned>(target.username.size()));
    const std::string authlist = methods ? methods : "";
    if (authlist.find("publickey") == std::string::npos) {
        err = "no credentials and server does not accept public keys";
        return false;
    }
    bool authed = false;
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            if (libssh2_agent_userauth(agent, target.username.c_str(),
                                       identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    if (!authed)
        err = "no credentials: key, password and agent unavailable";
    return authed;
}

bool Libssh2ChannelSession::handshake(const SshTarget &target,
                                      std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000);
#endif
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);
    return verifyHostKey(target, err) && authenticate(target, err);
}

bool Libssh2ChannelSession::connect(const SshTarget &target, std::string &err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    if (!tcpConnect(target.host, target.port, err) || !handshake(target, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    qCInfo(txSsh) << "connected to" << QString::fromStdString(target.host)
                  << "port" << target.port;
    return true;
}

bool Libssh2ChannelSession::openExec(const std::string &command,
                                     bool requestPty, std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) {
        err = "not connected";
        return false;
    }
    if (channel_) {
        err = "channel already open";
        return false;
    }
    channel_ = libssh2_channel_open_session(session_);
    if (!channel_) {
        err = "could not open channel: " + lastError();
        return false;
    }
    libssh2_channel_handle_extended_data2(channel_,
                                          LIBSSH2_CHANNEL_EXTENDED_DATA_IGNORE);
    if (requestPty && libssh2_channel_request_pty(channel_, "vt100") != 0) {
        err = "pty request failed: " + lastError();
        libssh2_channel_free(channel_);
        channel_ = nullptr;
        return false;
    }
    if (libssh2_channel_exec(channel_, command.c_str()) != 0) {
        err = "exec failed: " + lastError();
        libssh2_channel_free(channel_);
        channel_ = nullptr;
        return false;
    }
    libssh2_session_set_blocking(session_, 0);
    qCDebug(txSsh) << "remote command started"
                   << QString::fromStdString(describePath(command))
                   << (requestPty ? "with pty" : "without pty");
    return true;
}

void Libssh2ChannelSession::waitSocket(int extraFd, int timeoutMs,
                                       bool &extraReady) const {
    extraReady = false;
    int dir;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dir = session_ ? libssh2_session_block_directions(session_) : 0;
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        events |= POLLOUT;
    if (!events)
        events = POLLIN;

    struct pollfd pfds[2];
    nfds_t n = 1;
    pfds[0] = {sock_, events, 0};
    if (extraFd >= 0) {
        pfds[1] = {extraFd, POLLIN, 0};
        n = 2;
    }
    const int timeout =
        timeoutMs < 0 ? kPollSliceMs : std::min(timeoutMs, kPollSliceMs);
    const int rc = ::poll(pfds, n, timeout);
    if (rc > 0 && n == 2 && (pfds[1].revents & POLLIN))
        extraReady = true;
}

IoResult Libssh2ChannelSession::read(char *buf, std::size_t len,
                                     ReadInterrupt *interrupt) {
    IoResult r;
    for (;;) {
        if (interrupt && interrupt->triggered()) {
            r.status = IoStatus::Interrupted;
            return r;
        }
        ssize_t rc;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!channel_) {
                r.status = IoStatus::Closed;
                return r;
            }
            rc = libssh2_channel_read(channel_, buf, len);
            if (rc == 0 || rc == LIBSSH2_ERROR_EAGAIN)
                eof = libssh2_channel_eof(channel_) != 0;
        }
        if (rc > 0) {
            r.bytes = static_cast<std::size_t>(rc);
            return r;
        }
        if (eof) {
            r.status = IoStatus::Eof;
            return r;
        }
        if (rc == 0 || rc == LIBSSH2_ERROR_EAGAIN) {
            bool interrupted = false;
            waitSocket(interrupt && interrupt->valid() ? interrupt->fd() : -1,
                       interrupt ? interrupt->pollTimeoutMs() : -1,
                       interrupted);
            continue; // triggered() is checked at the top
        }
        qCDebug(txSsh) << "channel read failed:" << rc;
        r.status = IoStatus::Error;
        return r;
    }
}

IoResult Libssh2ChannelSession::write(const char *data, std::size_t len,
                                      ReadInterrupt *interrupt) {
    IoResult r;
    while (r.bytes < len) {
        if (interrupt && interrupt->triggered()) {
            r.status = IoStatus::Interrupted;
            return r;
        }
        ssize_t rc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!channel_) {
                r.status = IoStatus::Closed;
                return r;
            }
            rc = libssh2_channel_write(channel_, data + r.bytes, len - r.bytes);
        }
        if (rc > 0) {
            r.bytes += static_cast<std::size_t>(rc);
            continue;
        }
        if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
            // Remote window full: wait for the peer or the interrupt.
            bool interrupted = false;
            waitSocket(interrupt && interrupt->valid() ? interrupt->fd() : -1,
                       interrupt ? interrupt->pollTimeoutMs() : -1,
                       interrupted);
            continue; // triggered() is checked at the top
        }
        qCDebug(txSsh) << "channel write failed:" << rc;
        r.status = (rc == LIBSSH2_ERROR_CHANNEL_CLOSED ||
                    rc == LIBSSH2_ERROR_CHANNEL_EOF_SENT)
                       ? IoStatus::Closed
                       : IoStatus::Error;
        return r;
    }
    return r;
}

int Libssh2ChannelSession::closeChannel() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!channel_)
        return -1;
    // Blocking again: close and wait_closed are short handshakes.
    libssh2_session_set_blocking(session_, 1);
    libssh2_channel_close(channel_);
    libssh2_channel_wait_closed(channel_);
    const int status = libssh2_channel_get_exit_status(channel_);
    libssh2_channel_free(channel_);
    channel_ = nullptr;
    qCDebug(txSsh) << "channel closed, remote exit status" << status;
    return status;
}

void Libssh2ChannelSession::disconnect() {
    closeChannel();
    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

} // namespace termxfer

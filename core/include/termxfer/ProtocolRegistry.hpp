// Protocol definitions loaded from the sysop's protocols.json.
#pragma once
#include "TransferTypes.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace termxfer {

// Receive-side idle timeout applied to drivers known to loop forever on
// ZRINIT when the user cancels client-side without a ZMODEM abort. Must stay
// below sexyz's ~15 s retransmit interval.
constexpr std::chrono::milliseconds kKnownDriverRecvIdleTimeout{10000};

// Built-in list used when no protocols file exists: binary ZMODEM via lrzsz.
std::vector<ProtocolConfig> builtinProtocols();

// Missing file yields builtinProtocols() and returns true. Unreadable or
// malformed content returns false with `err` set. When `timings` is given,
// an optional "timings" object in the file overrides its fields.
bool loadProtocols(const std::string &path, std::vector<ProtocolConfig> &out,
                   std::string &err, BridgeTimings *timings = nullptr);

// Same as loadProtocols() for an in-memory document.
bool parseProtocols(const std::string &json, std::vector<ProtocolConfig> &out,
                    std::string &err, BridgeTimings *timings = nullptr);

// First entry flagged default, else the first entry. `ok` is false only for
// an empty list (the returned config is then empty).
ProtocolConfig defaultProtocol(const std::vector<ProtocolConfig> &protocols,
                               bool &ok);

// Case-insensitive lookup by key. On a miss `found` is false and the default
// protocol is returned so callers can fall back while logging the miss.
ProtocolConfig findProtocol(const std::vector<ProtocolConfig> &protocols,
                            const std::string &key, bool &found);

bool isAvailableFor(const ProtocolConfig &p, ConnectionKind kind);
std::vector<ProtocolConfig>
protocolsForConnection(const std::vector<ProtocolConfig> &protocols,
                       ConnectionKind kind);

// Resolves `command` like a shell would: names containing '/' are checked
// directly, others are searched on PATH. `resolved` is absolute.
bool resolveExecutable(const std::string &command, std::string &resolved);

// Entries whose send and receive commands both resolve right now.
std::vector<ProtocolConfig>
availableProtocols(const std::vector<ProtocolConfig> &protocols);

const char *connectionRestrictionName(ConnectionRestriction r);

} // namespace termxfer

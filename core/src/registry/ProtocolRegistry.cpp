// protocols.json loading and lookup helpers.
#include "termxfer/ProtocolRegistry.hpp"
#include "termxfer/Logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

namespace termxfer {

namespace {

std::string upper(const std::string &s) {
    std::string out(s);
    for (char &c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

std::string baseName(const std::string &path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

bool readString(const QJsonObject &o, const char *field, std::string &out,
                std::string &err) {
    const QJsonValue v = o.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull())
        return true;
    if (!v.isString()) {
        err = std::string("field '") + field + "' must be a string";
        return false;
    }
    out = v.toString().toStdString();
    return true;
}

bool readBool(const QJsonObject &o, const char *field, bool &out,
              std::string &err) {
    const QJsonValue v = o.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull())
        return true;
    if (!v.isBool()) {
        err = std::string("field '") + field + "' must be a boolean";
        return false;
    }
    out = v.toBool();
    return true;
}

bool readStringList(const QJsonObject &o, const char *field,
                    std::vector<std::string> &out, std::string &err) {
    const QJsonValue v = o.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull())
        return true;
    if (!v.isArray()) {
        err = std::string("field '") + field + "' must be an array of strings";
        return false;
    }
    out.clear();
    for (const QJsonValue item : v.toArray()) {
        if (!item.isString()) {
            err = std::string("field '") + field +
                  "' must be an array of strings";
            return false;
        }
        out.push_back(item.toString().toStdString());
    }
    return true;
}

// Upper bound for any configured duration; also keeps the double -> integer
// conversion in range.
constexpr double kMaxMillis = 24.0 * 60 * 60 * 1000;

// Returns false on a type error; `present` tells whether the field was set.
bool readMillis(const QJsonObject &o, const char *field,
                std::chrono::milliseconds &out, bool &present,
                std::string &err) {
    present = false;
    const QJsonValue v = o.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull())
        return true;
    if (!v.isDouble() || !(v.toDouble() >= 0 && v.toDouble() <= kMaxMillis)) {
        err = std::string("field '") + field +
              "' must be a non-negative number of milliseconds, at most "
              "86400000 (24 h)";
        return false;
    }
    out = std::chrono::milliseconds(static_cast<long long>(v.toDouble()));
    present = true;
    return true;
}

bool parseRestriction(const std::string &s, ConnectionRestriction &out) {
    const std::string u = upper(s);
    if (u.empty()) {
        out = ConnectionRestriction::Any;
    } else if (u == "SSH") {
        out = ConnectionRestriction::SshOnly;
    } else if (u == "TELNET") {
        out = ConnectionRestriction::TelnetOnly;
    } else {
        return false;
    }
    return true;
}

bool parseEntry(const QJsonObject &o, ProtocolConfig &p, std::string &err) {
    std::string conn;
    if (!readString(o, "key", p.key, err) ||
        !readString(o, "name", p.name, err) ||
        !readString(o, "description", p.description, err) ||
        !readString(o, "send_cmd", p.sendCommand, err) ||
        !readStringList(o, "send_args", p.sendArgs, err) ||
        !readString(o, "recv_cmd", p.recvCommand, err) ||
        !readStringList(o, "recv_args", p.recvArgs, err) ||
        !readBool(o, "batch_send", p.supportsBatch, err) ||
        !readBool(o, "use_pty", p.requiresPty, err) ||
        !readBool(o, "default", p.isDefault, err) ||
        !readString(o, "connection_type", conn, err)) {
        return false;
    }
    if (!parseRestriction(conn, p.connectionRestriction)) {
        err = "unknown connection_type '" + conn + "'";
        return false;
    }
    bool present = false;
    if (!readMillis(o, "recv_idle_timeout_ms", p.recvIdleTimeout, present, err))
        return false;
    if (!present) {
        // sexyz re-sends ZRINIT forever when the client cancels without CAN.
        const std::string base = upper(baseName(p.recvCommand));
        p.recvIdleTimeout = (base == "SEXYZ") ? kKnownDriverRecvIdleTimeout
                                              : std::chrono::milliseconds(0);
    }
    return true;
}

bool parseTimings(const QJsonObject &o, BridgeTimings &t, std::string &err) {
    bool present = false;
    return readMillis(o, "post_output_grace_ms", t.postOutputGrace, present, err) &&
           readMillis(o, "input_join_timeout_ms", t.inputJoinTimeout, present, err) &&
           readMillis(o, "drain_pause_ms", t.drainPause, present, err) &&
           readMillis(o, "drain_window_ms", t.drainWindow, present, err) &&
           readMillis(o, "pty_output_flush_ms", t.ptyOutputFlush, present, err);
}

} // namespace

std::vector<ProtocolConfig> builtinProtocols() {
    ProtocolConfig z;
    z.key = "Z";
    z.name = "Zmodem";
    z.description = "Zmodem (lrzsz)";
    z.sendCommand = "sz";
    z.sendArgs = {"-b", "-e"};
    z.recvCommand = "rz";
    z.recvArgs = {"-b", "-r"};
    z.supportsBatch = true;
    z.requiresPty = true;
    z.isDefault = true;
    return {z};
}

bool parseProtocols(const std::string &json, std::vector<ProtocolConfig> &out,
                    std::string &err, BridgeTimings *timings) {
    QJsonParseError pe;
    const QJsonDocument doc =
        QJsonDocument::fromJson(QByteArray::fromStdString(json), &pe);
    if (pe.error != QJsonParseError::NoError) {
        err = "invalid JSON at offset " + std::to_string(pe.offset) + ": " +
              pe.errorString().toStdString();
        return false;
    }

    QJsonArray list;
    if (doc.isArray()) {
        list = doc.array();
    } else if (doc.isObject()) {
        const QJsonObject root = doc.object();
        const QJsonValue protos = root.value(QLatin1String("protocols"));
        if (!protos.isArray()) {
            err = "'protocols' must be an array";
            return false;
        }
        list = protos.toArray();
        const QJsonValue tv = root.value(QLatin1String("timings"));
        if (!tv.isUndefined() && !tv.isNull()) {
            if (!tv.isObject()) {
                err = "'timings' must be an object";
                return false;
            }
            BridgeTimings parsed = timings ? *timings : BridgeTimings{};
            if (!parseTimings(tv.toObject(), parsed, err))
                return false;
            if (timings)
                *timings = parsed;
        }
    } else {
        err = "top level must be an array or an object";
        return false;
    }

    std::vector<ProtocolConfig> result;
    std::unordered_set<std::string> keys;
    int index = 0;
    for (const QJsonValue v : list) {
        if (!v.isObject()) {
            err = "protocol #" + std::to_string(index) + " is not an object";
            return false;
        }
        ProtocolConfig p;
        std::string entryErr;
        if (!parseEntry(v.toObject(), p, entryErr)) {
            err = "protocol #" + std::to_string(index) + ": " + entryErr;
            return false;
        }
        if (!keys.insert(upper(p.key)).second) {
            err = "duplicate protocol key '" + p.key + "'";
            return false;
        }
        result.push_back(std::move(p));
        ++index;
    }
    out = std::move(result);
    return true;
}

bool loadProtocols(const std::string &path, std::vector<ProtocolConfig> &out,
                   std::string &err, BridgeTimings *timings) {
    const QString qpath = QString::fromStdString(path);
    if (!QFileInfo::exists(qpath)) {
        qCInfo(txRegistry) << "protocols file not found, using built-in defaults:"
                           << qpath;
        out = builtinProtocols();
        return true;
    }
    QFile f(qpath);
    if (!f.open(QIODevice::ReadOnly)) {
        err = "failed to read protocols file '" + path +
              "': " + f.errorString().toStdString();
        return false;
    }
    const QByteArray data = f.readAll();
    std::string perr;
    if (!parseProtocols(data.toStdString(), out, perr, timings)) {
        err = "failed to parse protocols file '" + path + "': " + perr;
        return false;
    }
    qCInfo(txRegistry) << "loaded" << static_cast<int>(out.size())
                       << "protocols from" << qpath;
    return true;
}

ProtocolConfig defaultProtocol(const std::vector<ProtocolConfig> &protocols,
                               bool &ok) {
    ok = !protocols.empty();
    if (!ok)
        return {};
    for (const auto &p : protocols) {
        if (p.isDefault)
            return p;
    }
    return protocols.front();
}

ProtocolConfig findProtocol(const std::vector<ProtocolConfig> &protocols,
                            const std::string &key, bool &found) {
    const std::string u = upper(key);
    for (const auto &p : protocols) {
        if (upper(p.key) == u) {
            found = true;
            return p;
        }
    }
    found = false;
    bool ok = false;
    return defaultProtocol(protocols, ok);
}

bool isAvailableFor(const ProtocolConfig &p, ConnectionKind kind) {
    switch (p.connectionRestriction) {
    case ConnectionRestriction::Any:
        return true;
    case ConnectionRestriction::SshOnly:
        return kind == ConnectionKind::Ssh;
    case ConnectionRestriction::TelnetOnly:
        return kind == ConnectionKind::Telnet;
    }
    return false;
}

std::vector<ProtocolConfig>
protocolsForConnection(const std::vector<ProtocolConfig> &protocols,
                       ConnectionKind kind) {
    std::vector<ProtocolConfig> out;
    std::copy_if(protocols.begin(), protocols.end(), std::back_inserter(out),
                 [kind](const ProtocolConfig &p) {
                     return isAvailableFor(p, kind);
                 });
    return out;
}

bool resolveExecutable(const std::string &command, std::string &resolved) {
    if (command.empty())
        return false;
    const QString qcmd = QString::fromStdString(command);
    if (command.find('/') != std::string::npos) {
        const QFileInfo fi(qcmd);
        if (!fi.isFile() || !fi.isExecutable())
            return false;
        resolved = fi.absoluteFilePath().toStdString();
        return true;
    }
    const QString found = QStandardPaths::findExecutable(qcmd);
    if (found.isEmpty())
        return false;
    resolved = QFileInfo(found).absoluteFilePath().toStdString();
    return true;
}

std::vector<ProtocolConfig>
availableProtocols(const std::vector<ProtocolConfig> &protocols) {
    std::vector<ProtocolConfig> out;
    for (const auto &p : protocols) {
        std::string s, r;
        if (resolveExecutable(p.sendCommand, s) &&
            resolveExecutable(p.recvCommand, r)) {
            out.push_back(p);
        } else {
            qCDebug(txRegistry) << "protocol" << QString::fromStdString(p.key)
                                << "unavailable: driver not on PATH";
        }
    }
    return out;
}

const char *connectionRestrictionName(ConnectionRestriction r) {
    switch (r) {
    case ConnectionRestriction::Any:
        return "any";
    case ConnectionRestriction::SshOnly:
        return "ssh";
    case ConnectionRestriction::TelnetOnly:
        return "telnet";
    }
    return "unknown";
}

} // namespace termxfer

// Redaction of user data (file names, upload directories, driver argv) in
// log output. Verbatim values are only logged on a development host with
// TERMXFER_ENV=dev|development|local|debug and TERMXFER_LOG_SENSITIVE set.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <string>
#include <vector>

namespace termxfer {

namespace logpolicy {

// Lower-cased value of `name` without surrounding blanks; empty if unset.
inline std::string envToken(const char *name) {
    const char *raw = std::getenv(name);
    std::string v = raw ? raw : "";
    auto blank = [](unsigned char c) { return std::isspace(c) != 0; };
    v.erase(v.begin(), std::find_if_not(v.begin(), v.end(), blank));
    v.erase(std::find_if_not(v.rbegin(), v.rend(), blank).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

inline bool readSensitiveFlag() {
    static const char *const kDevEnvs[] = {"dev", "development", "local",
                                           "debug"};
    static const char *const kOn[] = {"1", "true", "yes", "on"};
    const std::string env = envToken("TERMXFER_ENV");
    const std::string flag = envToken("TERMXFER_LOG_SENSITIVE");
    const bool dev = std::find(std::begin(kDevEnvs), std::end(kDevEnvs), env) !=
                     std::end(kDevEnvs);
    const bool on =
        std::find(std::begin(kOn), std::end(kOn), flag) != std::end(kOn);
    return dev && on;
}

} // namespace logpolicy

// Read once per process; the environment is not expected to change.
inline bool sensitiveLoggingEnabled() {
    static const bool enabled = logpolicy::readSensitiveFlag();
    return enabled;
}

inline std::string describeArgs(const std::vector<std::string> &args) {
    if (!sensitiveLoggingEnabled())
        return std::to_string(args.size()) + " args";
    std::string out = "[";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i)
            out += ' ';
        out += args[i];
    }
    out += ']';
    return out;
}

inline std::string describePath(const std::string &path) {
    return sensitiveLoggingEnabled() ? path : std::string("<redacted>");
}

} // namespace termxfer

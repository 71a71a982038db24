// Entry points used by the menu layer: validate the request, resolve the
// driver, expand its arguments and hand it to the transport bridge.
#pragma once
#include "CancelToken.hpp"
#include "Session.hpp"
#include "TransferTypes.hpp"
#include <string>
#include <vector>

namespace termxfer {

// Download to the user. `filePaths` must be absolute; more than one requires
// a batch-capable protocol. No idle timeout is applied.
bool executeSend(const CancelToken &cancel, Session &session,
                 const ProtocolConfig &protocol,
                 const std::vector<std::string> &filePaths,
                 TransferResult &result,
                 const BridgeTimings &timings = BridgeTimings{});

// Upload from the user into `targetDir` (absolute), which is also the
// driver's working directory. Uses the protocol's recvIdleTimeout.
bool executeReceive(const CancelToken &cancel, Session &session,
                    const ProtocolConfig &protocol,
                    const std::string &targetDir, TransferResult &result,
                    const BridgeTimings &timings = BridgeTimings{});

} // namespace termxfer

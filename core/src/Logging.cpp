#include "termxfer/Logging.hpp"
#include "termxfer/TransferTypes.hpp"

Q_LOGGING_CATEGORY(txRegistry, "termxfer.registry")
Q_LOGGING_CATEGORY(txBridge, "termxfer.bridge")
Q_LOGGING_CATEGORY(txProcess, "termxfer.process")
Q_LOGGING_CATEGORY(txSsh, "termxfer.ssh")

namespace termxfer {

const char *transferErrorName(TransferError e) {
    switch (e) {
    case TransferError::None:
        return "None";
    case TransferError::InvalidInput:
        return "InvalidInput";
    case TransferError::BinaryNotFound:
        return "BinaryNotFound";
    case TransferError::StartFailed:
        return "StartFailed";
    case TransferError::Cancelled:
        return "Cancelled";
    case TransferError::DeadlineExceeded:
        return "DeadlineExceeded";
    case TransferError::AbnormalExit:
        return "AbnormalExit";
    }
    return "Unknown";
}

const char *endCauseName(EndCause c) {
    switch (c) {
    case EndCause::None:
        return "None";
    case EndCause::NormalExit:
        return "NormalExit";
    case EndCause::IdleTimedOut:
        return "IdleTimedOut";
    case EndCause::AbortDetected:
        return "AbortDetected";
    case EndCause::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace termxfer

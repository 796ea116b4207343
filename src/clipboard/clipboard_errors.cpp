#include "clipboard_errors.h"

namespace cliphist {

const char* errorCodeName(ClipboardErrorCode code) {
    switch (code) {
        case ClipboardErrorCode::None: return "None";
        case ClipboardErrorCode::PersistenceFailure: return "PersistenceFailure";
        case ClipboardErrorCode::PinLimitExceeded: return "PinLimitExceeded";
        case ClipboardErrorCode::CapabilityUnavailable: return "CapabilityUnavailable";
        case ClipboardErrorCode::MalformedClipboardPayload: return "MalformedClipboardPayload";
        default: return "Unknown";
    }
}

} // namespace cliphist

#include "status.h"

namespace ua {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "OK";
        case ErrorCode::ConfigurationError: return "ConfigurationError";
        case ErrorCode::TransientTransportError: return "TransientTransportError";
        case ErrorCode::SlotExpiredError: return "SlotExpiredError";
        case ErrorCode::RemoteRejectedChunk: return "RemoteRejectedChunk";
        case ErrorCode::IncompleteUploadError: return "IncompleteUploadError";
        case ErrorCode::DeadlineExceeded: return "DeadlineExceeded";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
}

std::string Status::toString() const {
    if (ok()) {
        return "OK";
    }
    std::string result = errorCodeName(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace ua

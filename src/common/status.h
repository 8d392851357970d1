#pragma once

#include <string>
#include <utility>

namespace ua {

enum class ErrorCode {
    Ok,
    ConfigurationError,
    TransientTransportError,
    SlotExpiredError,
    RemoteRejectedChunk,
    IncompleteUploadError,
    DeadlineExceeded,
    Cancelled,
    IoError
};

const char* errorCodeName(ErrorCode code);

// Result of an engine operation. Modeled after grpc::Status: cheap to copy,
// ok() when code is ErrorCode::Ok.
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    Status(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    bool ok() const { return code_ == ErrorCode::Ok; }
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    // Transient transport failures and expired slots are worth another attempt
    bool isRetryable() const {
        return code_ == ErrorCode::TransientTransportError ||
               code_ == ErrorCode::SlotExpiredError;
    }

    std::string toString() const;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace ua

#include "retry_policy.h"

#include <algorithm>
#include <stdexcept>

namespace ua {

const char* retryActionName(RetryAction action) {
    switch (action) {
        case RetryAction::Retry: return "retry";
        case RetryAction::RefreshSlotAndRetry: return "refresh_slot";
        case RetryAction::GiveUp: return "give_up";
    }
    return "unknown";
}

RetryPolicy::RetryPolicy(int tries, int max_slot_refreshes, int backoff_initial_ms, int backoff_max_ms)
    : tries_(tries),
      max_slot_refreshes_(max_slot_refreshes),
      backoff_initial_ms_(backoff_initial_ms),
      backoff_max_ms_(backoff_max_ms) {
    if (tries_ <= 0) {
        throw std::invalid_argument("tries must be > 0");
    }
    if (backoff_initial_ms_ < 0 || backoff_max_ms_ < backoff_initial_ms_) {
        throw std::invalid_argument("invalid backoff range");
    }
}

RetryPolicy::RetryPolicy(const JobOptions& options)
    : RetryPolicy(options.tries, options.max_slot_refreshes,
                  options.backoff_initial_ms, options.backoff_max_ms) {
}

RetryAction RetryPolicy::decide(const Status& error, const ChunkOutcome& outcome) const {
    if (!error.isRetryable()) {
        return RetryAction::GiveUp;
    }
    if (error.code() == ErrorCode::SlotExpiredError) {
        return outcome.slot_refreshes > max_slot_refreshes_ ? RetryAction::GiveUp
                                                           : RetryAction::RefreshSlotAndRetry;
    }
    // Expired slots do not count against the try budget
    int counted = outcome.attempts - outcome.slot_refreshes;
    return counted >= tries_ ? RetryAction::GiveUp : RetryAction::Retry;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(int failures, std::mt19937& rng) const {
    if (failures < 1 || backoff_initial_ms_ == 0) {
        return std::chrono::milliseconds(0);
    }
    int64_t step = backoff_initial_ms_;
    for (int i = 1; i < failures && step < backoff_max_ms_; ++i) {
        step *= 2;
    }
    step = std::min<int64_t>(step, backoff_max_ms_);

    std::uniform_int_distribution<int64_t> jitter(0, step / 2);
    return std::chrono::milliseconds(step - step / 2 + jitter(rng));
}

ErrorCode classifyHttpStatus(int http_status, int slot_expired_status) {
    if (http_status >= 200 && http_status < 300) {
        return ErrorCode::Ok;
    }
    if (http_status == slot_expired_status) {
        return ErrorCode::SlotExpiredError;
    }
    if (http_status >= 500 || http_status == 408 || http_status == 429) {
        return ErrorCode::TransientTransportError;
    }
    // Remaining 4xx (and unexpected 1xx/3xx) mean the request itself is wrong:
    // bad credentials, malformed headers, a closed file. Retrying will not help.
    return ErrorCode::RemoteRejectedChunk;
}

} // namespace ua

#pragma once

#include "chunk_state.h"
#include "status.h"
#include "utils.h"

#include <chrono>
#include <random>

namespace ua {

enum class RetryAction {
    Retry,                // back off, then try the same chunk again
    RefreshSlotAndRetry,  // slot expired: fetch a new one, no backoff budget used
    GiveUp                // fatal for the chunk and therefore for the job
};

const char* retryActionName(RetryAction action);

// Exponential backoff with jitter and a capped number of tries per chunk.
// Stateless: every decision is a function of the error and the chunk's
// outcome so far, which keeps it testable without any network.
class RetryPolicy {
public:
    RetryPolicy(int tries, int max_slot_refreshes, int backoff_initial_ms, int backoff_max_ms);
    explicit RetryPolicy(const JobOptions& options);

    // outcome already includes the attempt that produced error
    RetryAction decide(const Status& error, const ChunkOutcome& outcome) const;

    // Delay before retry number `failures` (1-based): the exponential step
    // capped at the maximum, with the upper half randomized.
    std::chrono::milliseconds backoffDelay(int failures, std::mt19937& rng) const;

    int tries() const { return tries_; }
    int maxSlotRefreshes() const { return max_slot_refreshes_; }

private:
    int tries_;
    int max_slot_refreshes_;
    int backoff_initial_ms_;
    int backoff_max_ms_;
};

// Maps an HTTP response code from the data plane onto the error taxonomy.
// 2xx is ErrorCode::Ok.
ErrorCode classifyHttpStatus(int http_status, int slot_expired_status);

} // namespace ua

#pragma once

#include "cancellation.h"
#include "progress_tracker.h"
#include "retry_policy.h"
#include "upload_api.h"

#include <mutex>
#include <random>
#include <string>

namespace ua {

// Calls per slot request inside one chunk attempt. The worker pool retries
// the whole attempt on top of this, so the budget stays small.
constexpr int SLOT_REQUEST_TRIES = 2;

// Negotiates per-chunk upload slots and closes the remote file, retrying
// idempotent control-plane calls with the job's backoff policy.
class UploadCoordinator {
public:
    UploadCoordinator(UploadApi& api, const RetryPolicy& policy,
                      const CancellationToken& cancel, std::string file_id);

    // Safe to repeat for the same chunk until it is acknowledged.
    // RemoteRejectedChunk is returned immediately, transient errors only
    // after SLOT_REQUEST_TRIES calls (fewer if the job allows fewer tries).
    Status requestSlot(int chunk_index, int64_t payload_length, const std::string& md5,
                       bool compressed, UploadSlot* slot);

    // Closes the remote file. Precondition: every chunk in tracker is Acked;
    // otherwise IncompleteUploadError and the close API is not called.
    Status acknowledgeCompletion(const ProgressTracker& tracker);

    const std::string& fileId() const { return file_id_; }

private:
    template <typename Call>
    Status withRetries(const std::string& what, int tries, Call call);

    UploadApi& api_;
    const RetryPolicy& policy_;
    const CancellationToken& cancel_;
    std::string file_id_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace ua

#include "upload_coordinator.h"
#include "utils.h"

#include <algorithm>

namespace ua {

UploadCoordinator::UploadCoordinator(UploadApi& api, const RetryPolicy& policy,
                                     const CancellationToken& cancel, std::string file_id)
    : api_(api),
      policy_(policy),
      cancel_(cancel),
      file_id_(std::move(file_id)),
      rng_(std::random_device{}()) {
}

template <typename Call>
Status UploadCoordinator::withRetries(const std::string& what, int tries, Call call) {
    Status status;
    for (int attempt = 1; attempt <= tries; ++attempt) {
        if (cancel_.isCancelled()) {
            return Status(cancel_.reason(), what + " abandoned");
        }
        status = call();
        if (status.ok() || status.code() != ErrorCode::TransientTransportError) {
            return status;
        }
        if (attempt == tries) {
            break;
        }

        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            delay = policy_.backoffDelay(attempt, rng_);
        }
        Utils::logWarning(what + " failed (" + status.toString() + "), retrying in " +
                          Utils::formatDuration(delay.count()));
        if (!cancel_.sleepFor(delay)) {
            return Status(cancel_.reason(), what + " abandoned");
        }
    }
    return status;
}

Status UploadCoordinator::requestSlot(int chunk_index, int64_t payload_length, const std::string& md5,
                                      bool compressed, UploadSlot* slot) {
    SlotRequest request;
    request.file_id = file_id_;
    request.chunk_index = chunk_index;
    request.size = payload_length;
    request.md5 = md5;
    request.compressed = compressed;

    return withRetries("slot request for chunk " + std::to_string(chunk_index),
                       std::min(SLOT_REQUEST_TRIES, policy_.tries()),
                       [&]() { return api_.requestSlot(request, slot); });
}

Status UploadCoordinator::acknowledgeCompletion(const ProgressTracker& tracker) {
    if (!tracker.allAcked()) {
        auto outstanding = tracker.outstanding();
        return Status(ErrorCode::IncompleteUploadError,
                      std::to_string(outstanding.size()) + " chunk(s) of " + file_id_ +
                      " not acknowledged; refusing to close");
    }

    Status status = withRetries("close of " + file_id_, policy_.tries(),
                                [&]() { return api_.closeFile(file_id_); });
    if (status.ok()) {
        Utils::logInfo("Closed " + file_id_ + " (" + Utils::formatFileSize(tracker.totalBytes()) + ")");
    }
    return status;
}

} // namespace ua

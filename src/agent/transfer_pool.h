#pragma once

#include "cancellation.h"
#include "chunk_planner.h"
#include "chunk_processor.h"
#include "http_transport.h"
#include "progress_tracker.h"
#include "retry_policy.h"
#include "upload_coordinator.h"
#include "utils.h"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace ua {

// Fixed set of worker threads draining one queue of chunk indices. The
// queue hands each index to at most one worker at a time; failed attempts
// go back in (once) with a backoff timestamp. Among ready chunks the lowest
// index goes first.
class TransferPool {
public:
    using Clock = std::chrono::steady_clock;

    TransferPool(const std::vector<Chunk>& chunks,
                 const ChunkProcessor& processor,
                 UploadCoordinator& coordinator,
                 ChunkTransport& transport,
                 ProgressTracker& tracker,
                 const RetryPolicy& policy,
                 CancellationToken& cancel,
                 int worker_count,
                 Metrics* metrics = nullptr);
    ~TransferPool();

    TransferPool(const TransferPool&) = delete;
    TransferPool& operator=(const TransferPool&) = delete;

    // Uploads every chunk the tracker does not already have as Acked and
    // blocks until done. Returns OK only when all chunks are Acked; a chunk
    // that runs out of tries fails the whole run. When deadline passes, the
    // job is cancelled with DeadlineExceeded.
    Status run(std::optional<Clock::time_point> deadline = std::nullopt);

private:
    void workerLoop();
    bool takeNext(int* index);
    void attempt(int index);
    // Returns the chunk to the queue when delay is set
    void finishAttempt(int index, std::optional<std::chrono::milliseconds> delay);
    void setFatal(const Status& status);

    const std::vector<Chunk>& chunks_;
    const ChunkProcessor& processor_;
    UploadCoordinator& coordinator_;
    ChunkTransport& transport_;
    ProgressTracker& tracker_;
    const RetryPolicy& policy_;
    CancellationToken& cancel_;
    int worker_count_;
    Metrics* metrics_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int, Clock::time_point> queue_;  // index -> not before
    int in_flight_ = 0;
    int active_workers_ = 0;
    Status fatal_;
    std::vector<std::thread> threads_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace ua

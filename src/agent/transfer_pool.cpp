#include "transfer_pool.h"

#include <algorithm>

namespace ua {

namespace {

// Upper bound on how long an idle worker sleeps before rechecking cancellation
constexpr auto IDLE_POLL = std::chrono::milliseconds(100);

} // namespace

TransferPool::TransferPool(const std::vector<Chunk>& chunks,
                           const ChunkProcessor& processor,
                           UploadCoordinator& coordinator,
                           ChunkTransport& transport,
                           ProgressTracker& tracker,
                           const RetryPolicy& policy,
                           CancellationToken& cancel,
                           int worker_count,
                           Metrics* metrics)
    : chunks_(chunks),
      processor_(processor),
      coordinator_(coordinator),
      transport_(transport),
      tracker_(tracker),
      policy_(policy),
      cancel_(cancel),
      worker_count_(worker_count),
      metrics_(metrics),
      rng_(std::random_device{}()) {
    if (worker_count_ <= 0) {
        throw std::invalid_argument("worker count must be > 0");
    }
}

TransferPool::~TransferPool() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

Status TransferPool::run(std::optional<Clock::time_point> deadline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        fatal_ = Status::OK();
        Clock::time_point now = Clock::now();
        for (int index : tracker_.indicesWithStatus(ChunkStatus::Pending)) {
            queue_[index] = now;
        }
        if (queue_.empty()) {
            return tracker_.allAcked() ? Status::OK()
                                       : Status(ErrorCode::IncompleteUploadError,
                                                "no chunks left to dispatch but upload is incomplete");
        }
        active_workers_ = std::min<int>(worker_count_, static_cast<int>(queue_.size()));
    }

    Utils::logDebug("Starting " + std::to_string(active_workers_) + " upload worker(s) for " +
                    std::to_string(queue_.size()) + " chunk(s)");
    for (int i = 0; i < active_workers_; ++i) {
        threads_.emplace_back(&TransferPool::workerLoop, this);
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto done = [this] { return active_workers_ == 0; };
        if (deadline) {
            if (!cv_.wait_until(lock, *deadline, done)) {
                lock.unlock();
                Utils::logError("Job deadline reached; stopping workers");
                cancel_.cancel(ErrorCode::DeadlineExceeded);
                lock.lock();
                cv_.wait(lock, done);
            }
        } else {
            cv_.wait(lock, done);
        }
    }
    for (auto& thread : threads_) {
        thread.join();
    }
    threads_.clear();

    if (!fatal_.ok()) {
        return fatal_;
    }
    if (cancel_.isCancelled()) {
        ErrorCode reason = cancel_.reason();
        return Status(reason, reason == ErrorCode::DeadlineExceeded ? "job deadline exceeded"
                                                                    : "upload cancelled");
    }
    if (!tracker_.allAcked()) {
        return Status(ErrorCode::IncompleteUploadError, "workers stopped before every chunk was acknowledged");
    }
    return Status::OK();
}

void TransferPool::workerLoop() {
    int index = 0;
    while (takeNext(&index)) {
        attempt(index);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_workers_--;
    }
    cv_.notify_all();
}

bool TransferPool::takeNext(int* index) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!fatal_.ok() || cancel_.isCancelled()) {
            return false;
        }
        if (queue_.empty()) {
            if (in_flight_ == 0) {
                return false;
            }
            cv_.wait_for(lock, IDLE_POLL);
            continue;
        }

        Clock::time_point now = Clock::now();
        Clock::time_point earliest = Clock::time_point::max();
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (it->second <= now) {
                *index = it->first;
                queue_.erase(it);
                in_flight_++;
                return true;
            }
            earliest = std::min(earliest, it->second);
        }
        cv_.wait_until(lock, std::min(earliest, now + IDLE_POLL));
    }
}

void TransferPool::finishAttempt(int index, std::optional<std::chrono::milliseconds> delay) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (delay) {
            queue_[index] = Clock::now() + *delay;
        }
        in_flight_--;
    }
    cv_.notify_all();
}

void TransferPool::setFatal(const Status& status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fatal_.ok()) {
            fatal_ = status;
        }
    }
    cv_.notify_all();
}

void TransferPool::attempt(int index) {
    const Chunk& chunk = chunks_[index];
    auto started = Clock::now();

    if (!tracker_.beginAttempt(index)) {
        Utils::logError("Chunk " + std::to_string(index) + " was dispatched twice; dropping duplicate");
        finishAttempt(index, std::nullopt);
        return;
    }
    if (metrics_) metrics_->incrementAttempts();
    int attempt_number = tracker_.outcome(index).attempts;
    Utils::logDebug("Chunk " + std::to_string(index) + " attempt " + std::to_string(attempt_number) +
                    " (offset " + std::to_string(chunk.offset) + ", " +
                    std::to_string(chunk.length) + " bytes)");

    ChunkPayload payload;
    Status status = processor_.process(chunk, &payload);
    if (status.ok()) {
        tracker_.recordPayload(index, static_cast<int64_t>(payload.bytes.size()),
                               payload.compressed, payload.md5);

        UploadSlot slot;
        status = coordinator_.requestSlot(index, static_cast<int64_t>(payload.bytes.size()),
                                          payload.md5, payload.compressed, &slot);
        if (status.ok()) {
            tracker_.apply(index, ChunkEvent::SlotGranted);
            if (slot.expired(Utils::getCurrentTimestamp())) {
                status = Status(ErrorCode::SlotExpiredError, "slot expired before the transfer started");
            } else if (!cancel_.isCancelled()) {
                tracker_.apply(index, ChunkEvent::TransferStarted);
                status = transport_.put(slot, payload, cancel_);
            }
        }
    }
    if (status.ok() && cancel_.isCancelled() &&
        tracker_.outcome(index).status != ChunkStatus::Uploading) {
        status = Status(cancel_.reason(), "attempt abandoned");
    }

    if (status.ok()) {
        if (!tracker_.recordAck(index)) {
            Utils::logError("Conflicting acknowledgment for chunk " + std::to_string(index));
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        if (metrics_) {
            metrics_->incrementChunksAcked();
            metrics_->addRawBytes(chunk.length);
            metrics_->addWireBytes(static_cast<int64_t>(payload.bytes.size()));
            metrics_->recordChunkTime(elapsed.count());
        }
        Utils::logDebug("Chunk " + std::to_string(index) + " acknowledged in " +
                        Utils::formatDuration(elapsed.count()));
        finishAttempt(index, std::nullopt);
        return;
    }

    tracker_.recordFailure(index, status);

    if (cancel_.isCancelled()) {
        // Abandoned, not broken: leave it Pending for a later resume
        tracker_.apply(index, ChunkEvent::Requeue);
        finishAttempt(index, std::nullopt);
        return;
    }

    ChunkOutcome outcome = tracker_.outcome(index);
    RetryAction action = policy_.decide(status, outcome);
    if (action == RetryAction::GiveUp) {
        Utils::logError("Chunk " + std::to_string(index) + " failed after " +
                        std::to_string(outcome.attempts) + " attempt(s): " + status.toString());
        setFatal(Status(status.code(), "chunk " + std::to_string(index) + " failed after " +
                                       std::to_string(outcome.attempts) + " attempt(s): " +
                                       status.message()));
        finishAttempt(index, std::nullopt);
        return;
    }

    std::chrono::milliseconds delay(0);
    if (action == RetryAction::Retry) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        delay = policy_.backoffDelay(outcome.attempts - outcome.slot_refreshes, rng_);
    }
    if (metrics_) metrics_->incrementRetries();
    Utils::logWarning("Chunk " + std::to_string(index) + " attempt " + std::to_string(outcome.attempts) +
                      " failed (" + status.toString() + "); " + retryActionName(action) +
                      " in " + Utils::formatDuration(delay.count()));
    tracker_.apply(index, ChunkEvent::Requeue);
    finishAttempt(index, delay);
}

} // namespace ua

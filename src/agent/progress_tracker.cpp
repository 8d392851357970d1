#include "progress_tracker.h"
#include "utils.h"

namespace ua {

ProgressTracker::ProgressTracker(const std::vector<Chunk>& chunks)
    : outcomes_(chunks.size()) {
    lengths_.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        lengths_.push_back(chunk.length);
        total_bytes_ += chunk.length;
    }
}

bool ProgressTracker::applyLocked(int index, ChunkEvent event) {
    if (!validIndex(index)) {
        return false;
    }
    ChunkOutcome& outcome = outcomes_[index];
    auto next = nextStatus(outcome.status, event);
    if (!next) {
        Utils::logWarning("Rejected " + std::string(chunkEventName(event)) + " for chunk " +
                          std::to_string(index) + " in state " + chunkStatusName(outcome.status));
        return false;
    }
    outcome.status = *next;
    return true;
}

bool ProgressTracker::apply(int index, ChunkEvent event) {
    if (event == ChunkEvent::Acknowledged) {
        return recordAck(index);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return applyLocked(index, event);
}

bool ProgressTracker::beginAttempt(int index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!applyLocked(index, ChunkEvent::Dispatch)) {
        return false;
    }
    outcomes_[index].attempts++;
    return true;
}

bool ProgressTracker::recordPayload(int index, int64_t payload_size, bool compressed,
                                    const std::string& md5) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!applyLocked(index, ChunkEvent::Processed)) {
        return false;
    }
    ChunkOutcome& outcome = outcomes_[index];
    outcome.payload_size = payload_size;
    outcome.compressed = compressed;
    outcome.md5 = md5;
    return true;
}

bool ProgressTracker::recordFailure(int index, const Status& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!applyLocked(index, ChunkEvent::AttemptFailed)) {
        return false;
    }
    ChunkOutcome& outcome = outcomes_[index];
    outcome.last_error = error;
    if (error.code() == ErrorCode::SlotExpiredError) {
        outcome.slot_refreshes++;
    }
    return true;
}

bool ProgressTracker::recordAck(int index) {
    int64_t acked = 0;
    uint64_t sequence = 0;
    std::vector<ChunkOutcome> snapshot;
    ProgressCallback progress;
    AckListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!applyLocked(index, ChunkEvent::Acknowledged)) {
            return false;
        }
        outcomes_[index].last_error = Status::OK();
        bytes_acked_ += lengths_[index];
        acked_count_++;
        sequence = ++ack_sequence_;
        acked = bytes_acked_;
        progress = progress_callback_;
        listener = ack_listener_;
        if (listener) {
            snapshot = outcomes_;
        }
    }
    if (progress) {
        progress(acked, total_bytes_);
    }
    if (listener) {
        listener(snapshot, sequence);
    }
    return true;
}

void ProgressTracker::restore(const std::vector<ChunkOutcome>& saved) {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_acked_ = 0;
    acked_count_ = 0;
    for (size_t i = 0; i < outcomes_.size(); ++i) {
        ChunkOutcome fresh;
        if (i < saved.size() && saved[i].status == ChunkStatus::Acked) {
            fresh = saved[i];
            fresh.last_error = Status::OK();
            bytes_acked_ += lengths_[i];
            acked_count_++;
        }
        outcomes_[i] = fresh;
    }
}

ChunkOutcome ProgressTracker::outcome(int index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!validIndex(index)) {
        return ChunkOutcome();
    }
    return outcomes_[index];
}

std::vector<ChunkOutcome> ProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

std::vector<int> ProgressTracker::indicesWithStatus(ChunkStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> indices;
    for (size_t i = 0; i < outcomes_.size(); ++i) {
        if (outcomes_[i].status == status) {
            indices.push_back(static_cast<int>(i));
        }
    }
    return indices;
}

std::vector<int> ProgressTracker::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> indices;
    for (size_t i = 0; i < outcomes_.size(); ++i) {
        if (outcomes_[i].status != ChunkStatus::Acked) {
            indices.push_back(static_cast<int>(i));
        }
    }
    return indices;
}

int64_t ProgressTracker::bytesAcked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_acked_;
}

bool ProgressTracker::allAcked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acked_count_ == outcomes_.size();
}

void ProgressTracker::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_callback_ = std::move(callback);
}

void ProgressTracker::setAckListener(AckListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ack_listener_ = std::move(listener);
}

} // namespace ua

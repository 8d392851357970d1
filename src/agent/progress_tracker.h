#pragma once

#include "chunk_planner.h"
#include "chunk_state.h"
#include "status.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ua {

// Single owner of every chunk's outcome for one file job. All updates go
// through here under one mutex, and each update is checked against the
// chunk state machine, so two workers can never record conflicting
// outcomes for the same chunk.
class ProgressTracker {
public:
    using ProgressCallback = std::function<void(int64_t, int64_t)>;
    // Invoked (outside the lock) with a snapshot each time a chunk is
    // acknowledged. sequence grows with every ack, so a listener can tell a
    // late-arriving older snapshot from a newer one.
    using AckListener = std::function<void(const std::vector<ChunkOutcome>&, uint64_t sequence)>;

    explicit ProgressTracker(const std::vector<Chunk>& chunks);

    // Applies a state machine event. Returns false (and changes nothing)
    // when the event is illegal for the chunk's current status.
    bool apply(int index, ChunkEvent event);

    // Pending -> InFlight; counts the attempt
    bool beginAttempt(int index);
    // InFlight -> Compressed; records what will go on the wire
    bool recordPayload(int index, int64_t payload_size, bool compressed, const std::string& md5);
    // Any in-progress status -> Failed
    bool recordFailure(int index, const Status& error);
    // Uploading -> Acked
    bool recordAck(int index);

    // Carries over acknowledged chunks from a previous run; everything else
    // restarts as Pending with a fresh attempt count. Entries whose index is
    // out of range are ignored.
    void restore(const std::vector<ChunkOutcome>& saved);

    ChunkOutcome outcome(int index) const;
    std::vector<ChunkOutcome> snapshot() const;
    std::vector<int> indicesWithStatus(ChunkStatus status) const;
    std::vector<int> outstanding() const;

    int64_t bytesAcked() const;
    int64_t totalBytes() const { return total_bytes_; }
    size_t chunkCount() const { return lengths_.size(); }
    bool allAcked() const;

    void setProgressCallback(ProgressCallback callback);
    void setAckListener(AckListener listener);

private:
    bool applyLocked(int index, ChunkEvent event);
    bool validIndex(int index) const {
        return index >= 0 && static_cast<size_t>(index) < lengths_.size();
    }

    std::vector<int64_t> lengths_;
    int64_t total_bytes_ = 0;

    mutable std::mutex mutex_;
    std::vector<ChunkOutcome> outcomes_;
    int64_t bytes_acked_ = 0;
    size_t acked_count_ = 0;
    uint64_t ack_sequence_ = 0;

    ProgressCallback progress_callback_;
    AckListener ack_listener_;
};

} // namespace ua

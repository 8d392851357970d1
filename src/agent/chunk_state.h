#pragma once

#include "status.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ua {

// Lifecycle of one chunk. An attempt walks
// Pending -> InFlight -> Compressed -> SlotRequested -> Uploading -> {Acked | Failed};
// the only backward edge is Failed -> Pending when the chunk is retried.
enum class ChunkStatus {
    Pending,
    InFlight,
    Compressed,
    SlotRequested,
    Uploading,
    Acked,
    Failed
};

enum class ChunkEvent {
    Dispatch,         // a worker took the chunk off the queue
    Processed,        // bytes read, compressed and checksummed
    SlotGranted,      // upload destination obtained
    TransferStarted,
    Acknowledged,     // service confirmed the bytes
    AttemptFailed,
    Requeue           // failed chunk scheduled for another attempt
};

const char* chunkStatusName(ChunkStatus status);
std::optional<ChunkStatus> chunkStatusFromName(const std::string& name);
const char* chunkEventName(ChunkEvent event);

// Pure transition function; nullopt when the event is not legal in the
// current state.
std::optional<ChunkStatus> nextStatus(ChunkStatus current, ChunkEvent event);

struct ChunkOutcome {
    ChunkStatus status = ChunkStatus::Pending;
    int attempts = 0;        // dispatches, including ones that hit an expired slot
    int slot_refreshes = 0;  // attempts that failed only because the slot expired
    Status last_error;
    int64_t payload_size = 0;
    bool compressed = false;
    std::string md5;
};

} // namespace ua

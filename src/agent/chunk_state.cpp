#include "chunk_state.h"

namespace ua {

const char* chunkStatusName(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::InFlight: return "in_flight";
        case ChunkStatus::Compressed: return "compressed";
        case ChunkStatus::SlotRequested: return "slot_requested";
        case ChunkStatus::Uploading: return "uploading";
        case ChunkStatus::Acked: return "acked";
        case ChunkStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<ChunkStatus> chunkStatusFromName(const std::string& name) {
    static const ChunkStatus all[] = {
        ChunkStatus::Pending, ChunkStatus::InFlight, ChunkStatus::Compressed,
        ChunkStatus::SlotRequested, ChunkStatus::Uploading, ChunkStatus::Acked,
        ChunkStatus::Failed
    };
    for (ChunkStatus status : all) {
        if (name == chunkStatusName(status)) {
            return status;
        }
    }
    return std::nullopt;
}

const char* chunkEventName(ChunkEvent event) {
    switch (event) {
        case ChunkEvent::Dispatch: return "dispatch";
        case ChunkEvent::Processed: return "processed";
        case ChunkEvent::SlotGranted: return "slot_granted";
        case ChunkEvent::TransferStarted: return "transfer_started";
        case ChunkEvent::Acknowledged: return "acknowledged";
        case ChunkEvent::AttemptFailed: return "attempt_failed";
        case ChunkEvent::Requeue: return "requeue";
    }
    return "unknown";
}

std::optional<ChunkStatus> nextStatus(ChunkStatus current, ChunkEvent event) {
    switch (event) {
        case ChunkEvent::Dispatch:
            if (current == ChunkStatus::Pending) return ChunkStatus::InFlight;
            break;
        case ChunkEvent::Processed:
            if (current == ChunkStatus::InFlight) return ChunkStatus::Compressed;
            break;
        case ChunkEvent::SlotGranted:
            if (current == ChunkStatus::Compressed) return ChunkStatus::SlotRequested;
            break;
        case ChunkEvent::TransferStarted:
            if (current == ChunkStatus::SlotRequested) return ChunkStatus::Uploading;
            break;
        case ChunkEvent::Acknowledged:
            if (current == ChunkStatus::Uploading) return ChunkStatus::Acked;
            break;
        case ChunkEvent::AttemptFailed:
            if (current == ChunkStatus::InFlight || current == ChunkStatus::Compressed ||
                current == ChunkStatus::SlotRequested || current == ChunkStatus::Uploading) {
                return ChunkStatus::Failed;
            }
            break;
        case ChunkEvent::Requeue:
            if (current == ChunkStatus::Failed) return ChunkStatus::Pending;
            break;
    }
    return std::nullopt;
}

} // namespace ua

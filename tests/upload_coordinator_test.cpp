#include "test_framework.h"
#include "fake_services.h"
#include "../src/agent/upload_coordinator.h"

namespace ua {
namespace test {

class UploadCoordinatorTest : public UATestBase {
protected:
    UploadCoordinatorTest() : policy_(3, 2, 1, 5) {}

    std::vector<Chunk> planChunks(int64_t size, int64_t chunk_size) {
        std::vector<Chunk> chunks;
        EXPECT_TRUE(ChunkPlanner(chunk_size).plan(size, "file-c", &chunks).ok());
        return chunks;
    }

    void ackAll(ProgressTracker& tracker) {
        for (size_t i = 0; i < tracker.chunkCount(); ++i) {
            int index = static_cast<int>(i);
            ASSERT_TRUE(tracker.beginAttempt(index));
            ASSERT_TRUE(tracker.recordPayload(index, 1, false, ""));
            ASSERT_TRUE(tracker.apply(index, ChunkEvent::SlotGranted));
            ASSERT_TRUE(tracker.apply(index, ChunkEvent::TransferStarted));
            ASSERT_TRUE(tracker.recordAck(index));
        }
    }

    FakeUploadApi api_;
    RetryPolicy policy_;
    CancellationToken cancel_;
};

TEST_F(UploadCoordinatorTest, RequestSlotPassesChunkIdentity) {
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    ASSERT_UA_OK(coordinator.requestSlot(4, 1234, "abcd", true, &slot));

    auto requests = api_.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].file_id, "file-c");
    EXPECT_EQ(requests[0].chunk_index, 4);
    EXPECT_EQ(requests[0].size, 1234);
    EXPECT_EQ(requests[0].md5, "abcd");
    EXPECT_TRUE(requests[0].compressed);
    EXPECT_FALSE(slot.url.empty());
}

TEST_F(UploadCoordinatorTest, NoCompressionFlagIsDeclared) {
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    ASSERT_UA_OK(coordinator.requestSlot(0, 10, "abcd", false, &slot));
    EXPECT_FALSE(api_.requests().at(0).compressed);
}

TEST_F(UploadCoordinatorTest, RetriesTransientErrors) {
    api_.failSlotRequest(0, Status(ErrorCode::TransientTransportError, "UNAVAILABLE"), 1);
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    ASSERT_UA_OK(coordinator.requestSlot(0, 10, "abcd", false, &slot));
    EXPECT_EQ(api_.requestCount(0), 2);
}

TEST_F(UploadCoordinatorTest, SlotRequestBudgetIsIndependentOfTries) {
    // The job allows 3 tries, but one attempt only spends SLOT_REQUEST_TRIES calls
    api_.failSlotRequest(0, Status(ErrorCode::TransientTransportError, "UNAVAILABLE"), 5);
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    EXPECT_UA_CODE(coordinator.requestSlot(0, 10, "abcd", false, &slot),
                   ErrorCode::TransientTransportError);
    EXPECT_EQ(api_.requestCount(0), SLOT_REQUEST_TRIES);
}

TEST_F(UploadCoordinatorTest, SingleTryJobMakesOneSlotCall) {
    api_.failSlotRequest(0, Status(ErrorCode::TransientTransportError, "UNAVAILABLE"), 5);
    RetryPolicy single(1, 2, 1, 5);
    UploadCoordinator coordinator(api_, single, cancel_, "file-c");
    UploadSlot slot;
    EXPECT_UA_CODE(coordinator.requestSlot(0, 10, "abcd", false, &slot),
                   ErrorCode::TransientTransportError);
    EXPECT_EQ(api_.requestCount(0), 1);
}

TEST_F(UploadCoordinatorTest, RejectionIsImmediate) {
    api_.failSlotRequest(1, Status(ErrorCode::RemoteRejectedChunk, "file is closed"));
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    EXPECT_UA_CODE(coordinator.requestSlot(1, 10, "abcd", false, &slot), ErrorCode::RemoteRejectedChunk);
    EXPECT_EQ(api_.requestCount(1), 1);
}

TEST_F(UploadCoordinatorTest, CancelledBeforeCall) {
    cancel_.cancel();
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    UploadSlot slot;
    EXPECT_UA_CODE(coordinator.requestSlot(0, 10, "abcd", false, &slot), ErrorCode::Cancelled);
    EXPECT_TRUE(api_.requests().empty());
}

TEST_F(UploadCoordinatorTest, CloseRequiresEveryChunkAcked) {
    auto chunks = planChunks(300, 100);
    ProgressTracker tracker(chunks);
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");

    EXPECT_UA_CODE(coordinator.acknowledgeCompletion(tracker), ErrorCode::IncompleteUploadError);
    EXPECT_EQ(api_.closeCalls(), 0);

    ackAll(tracker);
    ASSERT_UA_OK(coordinator.acknowledgeCompletion(tracker));
    EXPECT_EQ(api_.closeCalls(), 1);
    EXPECT_TRUE(api_.closed());
}

TEST_F(UploadCoordinatorTest, CloseRetriesTransientErrors) {
    auto chunks = planChunks(100, 100);
    ProgressTracker tracker(chunks);
    ackAll(tracker);

    api_.failClose(Status(ErrorCode::TransientTransportError, "DEADLINE_EXCEEDED"));
    UploadCoordinator coordinator(api_, policy_, cancel_, "file-c");
    ASSERT_UA_OK(coordinator.acknowledgeCompletion(tracker));
    EXPECT_EQ(api_.closeCalls(), 2);
}

} // namespace test
} // namespace ua

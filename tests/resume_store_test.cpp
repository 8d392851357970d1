#include "test_framework.h"
#include "../src/agent/chunk_planner.h"
#include "../src/agent/progress_tracker.h"
#include "../src/agent/resume_store.h"

#include <json/json.h>

#include <atomic>
#include <thread>

namespace ua {
namespace test {

class ResumeStoreTest : public UATestBase {
protected:
    ResumeRecord sampleRecord() {
        ResumeRecord record;
        record.file_id = "file-123";
        record.local_path = "/data/reads.fastq";
        record.file_size = 250;
        record.chunk_size = 100;
        record.chunks.resize(3);
        record.chunks[0].status = ChunkStatus::Acked;
        record.chunks[0].attempts = 1;
        record.chunks[0].payload_size = 61;
        record.chunks[0].compressed = true;
        record.chunks[0].md5 = "0123456789abcdef0123456789abcdef";
        record.chunks[1].status = ChunkStatus::Acked;
        record.chunks[1].attempts = 2;
        record.chunks[2].status = ChunkStatus::Failed;
        record.chunks[2].attempts = 3;
        record.chunks[2].last_error = Status(ErrorCode::TransientTransportError, "HTTP 503");
        return record;
    }
};

TEST_F(ResumeStoreTest, SaveAndLoad) {
    ResumeStore store(test_dir_ + "/state.json");
    std::string key = ResumeStore::jobKey("file-123", "/data/reads.fastq", 250, 1700000000, 100, true);
    ASSERT_TRUE(store.save(key, sampleRecord()));

    auto loaded = store.load(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->file_id, "file-123");
    EXPECT_EQ(loaded->local_path, "/data/reads.fastq");
    EXPECT_EQ(loaded->file_size, 250);
    EXPECT_EQ(loaded->chunk_size, 100);
    ASSERT_EQ(loaded->chunks.size(), 3u);
    EXPECT_EQ(loaded->chunks[0].status, ChunkStatus::Acked);
    EXPECT_EQ(loaded->chunks[0].payload_size, 61);
    EXPECT_TRUE(loaded->chunks[0].compressed);
    EXPECT_EQ(loaded->chunks[0].md5, "0123456789abcdef0123456789abcdef");
    EXPECT_EQ(loaded->chunks[1].attempts, 2);
    EXPECT_EQ(loaded->chunks[2].status, ChunkStatus::Failed);

    EXPECT_FALSE(store.load("unknown").has_value());
}

TEST_F(ResumeStoreTest, DocumentIsReadableJson) {
    std::string path = test_dir_ + "/state.json";
    ResumeStore store(path);
    ASSERT_TRUE(store.save("job-a", sampleRecord()));

    std::ifstream file(path);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    ASSERT_TRUE(Json::parseFromStream(builder, file, &root, &errors)) << errors;
    ASSERT_TRUE(root.isMember("job-a"));
    EXPECT_EQ(root["job-a"]["chunks"].size(), 3u);
    EXPECT_EQ(root["job-a"]["chunks"][2]["last_error"].asString(),
              "TransientTransportError: HTTP 503");
    EXPECT_FALSE(Utils::fileExists(path + ".tmp"));
}

TEST_F(ResumeStoreTest, MultipleJobsAndRemove) {
    ResumeStore store(test_dir_ + "/state.json");
    ASSERT_TRUE(store.save("job-a", sampleRecord()));
    ResumeRecord other = sampleRecord();
    other.file_id = "file-456";
    ASSERT_TRUE(store.save("job-b", other));

    ASSERT_TRUE(store.remove("job-a"));
    EXPECT_FALSE(store.load("job-a").has_value());
    ASSERT_TRUE(store.load("job-b").has_value());
    EXPECT_EQ(store.load("job-b")->file_id, "file-456");

    // Removing something absent is not an error
    EXPECT_TRUE(store.remove("job-a"));
}

TEST_F(ResumeStoreTest, CorruptFileIsIgnored) {
    std::string path = createTempFile("{ this is not json", "state.json");
    ResumeStore store(path);
    EXPECT_FALSE(store.load("job-a").has_value());

    // The next save replaces the corrupt document
    ASSERT_TRUE(store.save("job-a", sampleRecord()));
    EXPECT_TRUE(store.load("job-a").has_value());
}

TEST_F(ResumeStoreTest, OutOfRangeChunkIndexIsIgnored) {
    std::string path = createTempFile(
        R"({"job-a": {"file_id": "file-123", "chunks": [{"index": 2000000000, "status": "Acked"}]}})",
        "state.json");
    ResumeStore store(path);
    EXPECT_FALSE(store.load("job-a").has_value());

    ASSERT_TRUE(store.save("job-a", sampleRecord()));
    EXPECT_TRUE(store.load("job-a").has_value());
}

TEST_F(ResumeStoreTest, OlderSnapshotDoesNotReplaceNewer) {
    ResumeStore store(test_dir_ + "/state.json");
    ResumeRecord newer = sampleRecord();
    ResumeRecord older = sampleRecord();
    older.chunks[1].status = ChunkStatus::Uploading;

    ASSERT_TRUE(store.saveIfNewer("job-a", newer, 2));
    ASSERT_TRUE(store.saveIfNewer("job-a", older, 1));
    auto loaded = store.load("job-a");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunks[1].status, ChunkStatus::Acked);

    // A removed entry starts over
    ASSERT_TRUE(store.remove("job-a"));
    ASSERT_TRUE(store.saveIfNewer("job-a", older, 1));
    loaded = store.load("job-a");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->chunks[1].status, ChunkStatus::Uploading);
}

TEST_F(ResumeStoreTest, ConcurrentAcksKeepLatestTable) {
    std::vector<Chunk> chunks;
    ASSERT_UA_OK(ChunkPlanner(100).plan(200, "file-r", &chunks));
    ProgressTracker tracker(chunks);
    for (int index = 0; index < 2; ++index) {
        ASSERT_TRUE(tracker.beginAttempt(index));
        ASSERT_TRUE(tracker.recordPayload(index, 100, false, ""));
        ASSERT_TRUE(tracker.apply(index, ChunkEvent::SlotGranted));
        ASSERT_TRUE(tracker.apply(index, ChunkEvent::TransferStarted));
    }

    ResumeStore store(test_dir_ + "/state.json");
    std::atomic<int> calls{0};
    tracker.setAckListener([&](const std::vector<ChunkOutcome>& snapshot, uint64_t sequence) {
        // The first writer stalls so the second ack is saved before it
        if (calls++ == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        ResumeRecord record;
        record.file_id = "file-r";
        record.file_size = 200;
        record.chunk_size = 100;
        record.chunks = snapshot;
        EXPECT_TRUE(store.saveIfNewer("job-r", record, sequence));
    });

    std::thread first([&]() { EXPECT_TRUE(tracker.recordAck(0)); });
    while (calls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::thread second([&]() { EXPECT_TRUE(tracker.recordAck(1)); });
    first.join();
    second.join();

    EXPECT_TRUE(tracker.allAcked());
    auto loaded = store.load("job-r");
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->chunks.size(), 2u);
    EXPECT_EQ(loaded->chunks[0].status, ChunkStatus::Acked);
    EXPECT_EQ(loaded->chunks[1].status, ChunkStatus::Acked);
}

TEST_F(ResumeStoreTest, MissingFileIsEmpty) {
    ResumeStore store(test_dir_ + "/nothing_here.json");
    EXPECT_FALSE(store.load("job-a").has_value());
}

TEST_F(ResumeStoreTest, UnwritableLocationFailsSave) {
    ResumeStore store(test_dir_ + "/no/such/dir/state.json");
    EXPECT_FALSE(store.save("job-a", sampleRecord()));
}

TEST_F(ResumeStoreTest, JobKeyTracksIdentity) {
    std::string base = ResumeStore::jobKey("file-1", "/a/b", 1000, 42, 100, true);
    EXPECT_EQ(base, ResumeStore::jobKey("file-1", "/a/b", 1000, 42, 100, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-2", "/a/b", 1000, 42, 100, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-1", "/a/c", 1000, 42, 100, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-1", "/a/b", 1001, 42, 100, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-1", "/a/b", 1000, 43, 100, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-1", "/a/b", 1000, 42, 200, true));
    EXPECT_NE(base, ResumeStore::jobKey("file-1", "/a/b", 1000, 42, 100, false));
    EXPECT_EQ(base.size(), 32u);
}

} // namespace test
} // namespace ua

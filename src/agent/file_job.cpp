#include "file_job.h"
#include "chunk_planner.h"
#include "chunk_processor.h"
#include "retry_policy.h"
#include "transfer_pool.h"
#include "upload_coordinator.h"

#include <chrono>
#include <memory>

namespace ua {

FileJob::FileJob(std::string file_id, std::string local_path, JobOptions options,
                 UploadApi& api, ChunkTransport& transport, CancellationToken& cancel)
    : file_id_(std::move(file_id)),
      local_path_(std::move(local_path)),
      options_(std::move(options)),
      api_(api),
      transport_(transport),
      cancel_(cancel) {}

std::string FileJob::resumeKey(const std::string& file_id, const SourceFile& source,
                               const JobOptions& options) {
    std::string absolute = Utils::absolutePath(source.path());
    return ResumeStore::jobKey(file_id, absolute.empty() ? source.path() : absolute,
                               source.size(), source.modifiedTime(),
                               options.chunk_size, options.compress);
}

ResumeRecord FileJob::makeRecord(int64_t file_size, const std::vector<ChunkOutcome>& chunks) const {
    ResumeRecord record;
    record.file_id = file_id_;
    record.local_path = local_path_;
    record.file_size = file_size;
    record.chunk_size = options_.chunk_size;
    record.chunks = chunks;
    return record;
}

Status FileJob::loadResumeState(const std::string& file_id, const std::string& local_path,
                                const JobOptions& options, std::optional<ResumeRecord>* record) {
    record->reset();
    if (options.state_file.empty()) {
        return Status(ErrorCode::ConfigurationError, "no state file configured");
    }
    SourceFile source;
    Status status = source.open(local_path);
    if (!status.ok()) {
        return status;
    }
    ResumeStore store(options.state_file);
    *record = store.load(resumeKey(file_id, source, options));
    return Status::OK();
}

JobResult FileJob::run() {
    JobResult result;

    SourceFile source;
    result.status = source.open(local_path_);
    if (!result.status.ok()) {
        return result;
    }
    result.status = options_.validate(source.size());
    if (!result.status.ok()) {
        return result;
    }

    std::vector<Chunk> chunks;
    ChunkPlanner planner(options_.chunk_size, options_.allow_empty_file);
    result.status = planner.plan(source.size(), file_id_, &chunks);
    if (!result.status.ok()) {
        return result;
    }
    result.total_bytes = source.size();

    ProgressTracker tracker(chunks);

    std::unique_ptr<ResumeStore> store;
    std::string key;
    if (!options_.state_file.empty()) {
        store = std::make_unique<ResumeStore>(options_.state_file);
        key = resumeKey(file_id_, source, options_);
        auto saved = store->load(key);
        if (saved && saved->file_size == source.size() &&
            saved->chunk_size == options_.chunk_size && saved->chunks.size() == chunks.size()) {
            tracker.restore(saved->chunks);
            result.resumed_chunks =
                static_cast<int>(tracker.indicesWithStatus(ChunkStatus::Acked).size());
            if (result.resumed_chunks > 0) {
                Utils::logInfo("Resuming upload: " + std::to_string(result.resumed_chunks) + " of " +
                               std::to_string(chunks.size()) + " chunks already acknowledged");
            }
        } else if (saved) {
            Utils::logWarning("Ignoring resume state for " + local_path_ + ": chunk layout changed");
        }

        ResumeStore* store_ptr = store.get();
        int64_t file_size = source.size();
        tracker.setAckListener([this, store_ptr, key, file_size](const std::vector<ChunkOutcome>& snapshot,
                                                                 uint64_t sequence) {
            if (!store_ptr->saveIfNewer(key, makeRecord(file_size, snapshot), sequence)) {
                Utils::logWarning("Could not write resume state to " + store_ptr->path());
            }
        });
    }
    if (progress_callback_) {
        tracker.setProgressCallback(progress_callback_);
    }

    Utils::logInfo("Uploading " + local_path_ + " (" + Utils::formatFileSize(source.size()) + ") as " +
                   std::to_string(chunks.size()) + " chunk(s) of up to " +
                   Utils::formatFileSize(options_.chunk_size) + " with " +
                   std::to_string(options_.threads) + " worker(s)");

    RetryPolicy policy(options_);
    UploadCoordinator coordinator(api_, policy, cancel_, file_id_);
    ChunkProcessor processor(source, options_.compress, options_.compression_level);

    std::optional<TransferPool::Clock::time_point> deadline;
    if (options_.deadline_seconds > 0) {
        deadline = TransferPool::Clock::now() + std::chrono::seconds(options_.deadline_seconds);
    }

    {
        TransferPool pool(chunks, processor, coordinator, transport_, tracker, policy,
                          cancel_, options_.threads, metrics_);
        result.status = pool.run(deadline);
    }

    if (result.status.ok()) {
        result.status = coordinator.acknowledgeCompletion(tracker);
        result.closed = result.status.ok();
    }

    result.bytes_acked = tracker.bytesAcked();
    result.outstanding = tracker.outstanding();
    result.chunks = tracker.snapshot();

    if (store) {
        if (result.closed) {
            store->remove(key);
        } else if (!store->save(key, makeRecord(source.size(), result.chunks))) {
            Utils::logWarning("Could not write resume state to " + store->path());
        }
    }

    if (result.closed) {
        Utils::logInfo("Closed remote file " + file_id_);
    } else {
        Utils::logError("Upload of " + local_path_ + " failed: " + result.status.toString() + " (" +
                        std::to_string(result.outstanding.size()) + " chunk(s) outstanding)");
    }
    return result;
}

} // namespace ua

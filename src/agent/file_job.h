#pragma once

#include "cancellation.h"
#include "chunk_state.h"
#include "http_transport.h"
#include "progress_tracker.h"
#include "resume_store.h"
#include "source_file.h"
#include "upload_api.h"
#include "utils.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ua {

struct JobResult {
    Status status;
    int64_t bytes_acked = 0;
    int64_t total_bytes = 0;
    int resumed_chunks = 0;        // chunks skipped because a previous run acked them
    std::vector<int> outstanding;  // chunk indices not Acked when the job ended
    std::vector<ChunkOutcome> chunks;
    bool closed = false;
};

// One upload invocation: plans the file, restores resume state, drives the
// worker pool and closes the remote file once every chunk is acknowledged.
class FileJob {
public:
    FileJob(std::string file_id, std::string local_path, JobOptions options,
            UploadApi& api, ChunkTransport& transport, CancellationToken& cancel);

    void setProgressCallback(ProgressTracker::ProgressCallback callback) {
        progress_callback_ = std::move(callback);
    }
    void setMetrics(Metrics* metrics) { metrics_ = metrics; }

    JobResult run();

    // Resume entry for this file and these options, if any
    static Status loadResumeState(const std::string& file_id, const std::string& local_path,
                                  const JobOptions& options, std::optional<ResumeRecord>* record);

    static std::string resumeKey(const std::string& file_id, const SourceFile& source,
                                 const JobOptions& options);

private:
    ResumeRecord makeRecord(int64_t file_size, const std::vector<ChunkOutcome>& chunks) const;

    std::string file_id_;
    std::string local_path_;
    JobOptions options_;
    UploadApi& api_;
    ChunkTransport& transport_;
    CancellationToken& cancel_;
    ProgressTracker::ProgressCallback progress_callback_;
    Metrics* metrics_ = nullptr;
};

} // namespace ua

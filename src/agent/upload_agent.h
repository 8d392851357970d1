#pragma once

#include "cancellation.h"
#include "file_job.h"
#include "host_resolver.h"
#include "http_transport.h"
#include "upload_api.h"
#include "utils.h"

#include <memory>
#include <mutex>
#include <string>

namespace ua {

// Main upload agent: owns the control-plane client, the data-plane
// transport and the statistics shared by every job it runs.
class UploadAgent {
public:
    // Connects to the upload API at api_address; DNS rotation settings come
    // from Config.
    UploadAgent(const std::string& api_address, const JobOptions& options);
    // Uses the given collaborators instead of the network ones
    UploadAgent(std::unique_ptr<UploadApi> api, std::unique_ptr<ChunkTransport> transport,
                const JobOptions& options);
    ~UploadAgent();

    // Uploads local_file into remote file_id and closes it
    JobResult upload(const std::string& file_id, const std::string& local_file);

    // Prints the resumable chunk table for this file; false if there is none
    bool status(const std::string& file_id, const std::string& local_file);

    CancellationToken& cancellationToken() { return cancel_; }
    const Metrics& metrics() const { return metrics_; }

    void enableProgressBar(bool enable) { show_progress_ = enable; }

    void printStatistics();

private:
    void printProgressBar(int64_t current, int64_t total, const std::string& operation);

    JobOptions options_;
    std::unique_ptr<HostResolver> resolver_;
    std::unique_ptr<UploadApi> api_;
    std::unique_ptr<ChunkTransport> transport_;
    CancellationToken cancel_;
    Metrics metrics_;

    bool show_progress_ = false;
    std::mutex progress_mutex_;
};

} // namespace ua

#include "upload_agent.h"
#include "grpc_upload_api.h"

#include <chrono>
#include <iomanip>
#include <iostream>

namespace ua {

UploadAgent::UploadAgent(const std::string& api_address, const JobOptions& options)
    : options_(options) {
    Config& config = Config::getInstance();
    HostResolver::Options dns;
    dns.refresh_interval = std::chrono::seconds(config.getDnsRefreshSeconds());
    dns.failure_threshold = config.getDnsFailureThreshold();
    dns.cooldown = std::chrono::seconds(config.getDnsCooldownSeconds());

    resolver_ = std::make_unique<HostResolver>(dns);
    transport_ = std::make_unique<BeastHttpTransport>(*resolver_, options_.http_timeout_ms,
                                                      options_.slot_expired_status);
    api_ = GrpcUploadApi::connect(api_address, options_.api_timeout_ms);

    Utils::logInfo("Upload agent using API at " + api_address);
}

UploadAgent::UploadAgent(std::unique_ptr<UploadApi> api, std::unique_ptr<ChunkTransport> transport,
                         const JobOptions& options)
    : options_(options), api_(std::move(api)), transport_(std::move(transport)) {}

UploadAgent::~UploadAgent() = default;

JobResult UploadAgent::upload(const std::string& file_id, const std::string& local_file) {
    auto start_time = std::chrono::steady_clock::now();

    FileJob job(file_id, local_file, options_, *api_, *transport_, cancel_);
    job.setMetrics(&metrics_);
    job.setProgressCallback([this](int64_t current, int64_t total) {
        if (show_progress_) {
            printProgressBar(current, total, "Uploading");
        }
    });

    JobResult result = job.run();

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    if (result.closed) {
        int64_t sent = result.bytes_acked;
        std::cout << "Upload completed successfully\n";
        std::cout << "File size: " << Utils::formatFileSize(result.total_bytes) << "\n";
        if (result.resumed_chunks > 0) {
            std::cout << "Resumed: " << result.resumed_chunks << " chunk(s) already uploaded\n";
        }
        std::cout << "Duration: " << Utils::formatDuration(duration.count()) << "\n";

        if (sent > 0 && duration.count() > 0) {
            double speed = (sent / 1024.0 / 1024.0) / (duration.count() / 1000.0);
            std::cout << "Speed: " << std::fixed << std::setprecision(2) << speed << " MB/s\n";
        }
    }
    return result;
}

bool UploadAgent::status(const std::string& file_id, const std::string& local_file) {
    std::optional<ResumeRecord> record;
    Status loaded = FileJob::loadResumeState(file_id, local_file, options_, &record);
    if (!loaded.ok()) {
        std::cout << "Cannot read resume state: " << loaded.message() << std::endl;
        return false;
    }
    if (!record) {
        std::cout << "No resumable upload of " << local_file << " into " << file_id << std::endl;
        return false;
    }

    int acked = 0;
    for (const ChunkOutcome& chunk : record->chunks) {
        if (chunk.status == ChunkStatus::Acked) acked++;
    }

    std::cout << "Resumable upload: " << record->local_path << " -> " << record->file_id << std::endl;
    std::cout << "  Size: " << Utils::formatFileSize(record->file_size) << std::endl;
    std::cout << "  Chunk size: " << Utils::formatFileSize(record->chunk_size) << std::endl;
    std::cout << "  Acknowledged: " << acked << "/" << record->chunks.size() << " chunks" << std::endl;

    std::cout << std::left << std::setw(8) << "Chunk"
              << std::setw(12) << "Status"
              << std::setw(10) << "Attempts"
              << std::setw(12) << "Payload"
              << "Last error" << std::endl;
    std::cout << std::string(70, '-') << std::endl;
    for (size_t i = 0; i < record->chunks.size(); ++i) {
        const ChunkOutcome& chunk = record->chunks[i];
        std::cout << std::left << std::setw(8) << i
                  << std::setw(12) << chunkStatusName(chunk.status)
                  << std::setw(10) << chunk.attempts
                  << std::setw(12) << (chunk.payload_size > 0 ? Utils::formatFileSize(chunk.payload_size) : "-")
                  << (chunk.last_error.ok() ? "" : chunk.last_error.toString()) << std::endl;
    }
    return true;
}

void UploadAgent::printStatistics() {
    std::cout << "\nUpload Statistics:" << std::endl;
    std::cout << "  Chunks acknowledged: " << metrics_.getChunksAcked() << std::endl;
    std::cout << "  Attempts: " << metrics_.getAttempts() << std::endl;
    std::cout << "  Retries: " << metrics_.getRetries() << std::endl;
    std::cout << "  Bytes read: " << Utils::formatFileSize(metrics_.getRawBytes()) << std::endl;
    std::cout << "  Bytes sent: " << Utils::formatFileSize(metrics_.getWireBytes()) << std::endl;
    if (metrics_.getRawBytes() > 0) {
        std::cout << "  Compression ratio: " << std::fixed << std::setprecision(2)
                  << static_cast<double>(metrics_.getWireBytes()) / metrics_.getRawBytes() << std::endl;
    }
    std::cout << "  Average chunk time: " << std::fixed << std::setprecision(1)
              << metrics_.getAverageChunkTime() << " ms" << std::endl;
    Utils::logDebug("Metrics: " + metrics_.toJSON());
}

void UploadAgent::printProgressBar(int64_t current, int64_t total, const std::string& operation) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    const int bar_width = 50;
    double progress = total > 0 ? static_cast<double>(current) / total : 1.0;
    int filled = static_cast<int>(progress * bar_width);

    std::cout << "\r" << operation << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << (progress * 100) << "% ";
    std::cout << "(" << Utils::formatFileSize(current) << "/" << Utils::formatFileSize(total) << ")";
    std::cout.flush();

    if (current >= total) {
        std::cout << std::endl;
    }
}

} // namespace ua

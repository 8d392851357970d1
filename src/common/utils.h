#pragma once

#include "status.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ua {

// Configuration constants
constexpr int64_t DEFAULT_CHUNK_SIZE = 75LL * 1024 * 1024;      // 75MB chunks
constexpr int64_t MAX_CHUNK_SIZE = 5LL * 1024 * 1024 * 1024;    // service limit per part
constexpr int64_t MAX_CHUNK_COUNT = 10000;                      // service limit on parts
constexpr int DEFAULT_TRIES = 3;
constexpr int DEFAULT_MAX_SLOT_REFRESHES = 3;
constexpr int DEFAULT_COMPRESSION_LEVEL = 1;
constexpr int DEFAULT_BACKOFF_INITIAL_MS = 500;
constexpr int DEFAULT_BACKOFF_MAX_MS = 30000;
constexpr int DEFAULT_HTTP_TIMEOUT_MS = 600000;
constexpr int DEFAULT_API_TIMEOUT_MS = 60000;
constexpr int DEFAULT_DNS_REFRESH_SECONDS = 300;
constexpr int DEFAULT_DNS_FAILURE_THRESHOLD = 2;
constexpr int DEFAULT_DNS_COOLDOWN_SECONDS = 60;
constexpr int DEFAULT_SLOT_EXPIRED_STATUS = 410;

// Utility functions
class Utils {
public:
    // File system utilities
    static bool fileExists(const std::string& path);
    static int64_t getFileSize(const std::string& path);
    static int64_t getFileModifiedTime(const std::string& path);
    static std::string absolutePath(const std::string& path);

    // String utilities
    static std::vector<std::string> splitString(const std::string& str, char delimiter);
    static std::string joinStrings(const std::vector<std::string>& strings, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string toLower(std::string str);

    // Parses "64", "64K", "75M", "1G" (binary multiples). Returns -1 on bad input.
    static int64_t parseSize(const std::string& value);
    static bool parseBool(const std::string& value);

    // Formatting
    static std::string formatFileSize(int64_t bytes);
    static std::string formatDuration(int64_t milliseconds);

    // Time utilities
    static int64_t getCurrentTimestamp();
    static std::string timestampToString(int64_t timestamp);

    // Logging
    static void logInfo(const std::string& message);
    static void logWarning(const std::string& message);
    static void logError(const std::string& message);
    static void logDebug(const std::string& message);
    static void setVerbose(bool verbose) { verbose_ = verbose; }
    static bool isVerbose() { return verbose_; }

private:
    static void writeLog(const char* level, const std::string& message, bool to_stderr);

    static std::atomic<bool> verbose_;
    static std::mutex log_mutex_;
};

// Per-job settings, validated once when the job starts
struct JobOptions {
    int64_t chunk_size = DEFAULT_CHUNK_SIZE;
    bool compress = true;
    int compression_level = DEFAULT_COMPRESSION_LEVEL;
    int threads = 1;
    int tries = DEFAULT_TRIES;
    int max_slot_refreshes = DEFAULT_MAX_SLOT_REFRESHES;
    int backoff_initial_ms = DEFAULT_BACKOFF_INITIAL_MS;
    int backoff_max_ms = DEFAULT_BACKOFF_MAX_MS;
    int http_timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;
    int api_timeout_ms = DEFAULT_API_TIMEOUT_MS;
    int deadline_seconds = 0;  // 0 = no job deadline
    bool allow_empty_file = true;
    int slot_expired_status = DEFAULT_SLOT_EXPIRED_STATUS;
    std::string state_file;    // empty = no resume state

    Status validate(int64_t file_size) const;
};

// Configuration management
class Config {
public:
    static Config& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& configFile);

    // Apply a single key/value pair; returns false for unknown keys or bad values
    bool set(const std::string& key, const std::string& value);

    JobOptions toJobOptions() const { return options_; }

    // Getters
    const std::string& getApiAddress() const { return api_address_; }
    int getDnsRefreshSeconds() const { return dns_refresh_seconds_; }
    int getDnsFailureThreshold() const { return dns_failure_threshold_; }
    int getDnsCooldownSeconds() const { return dns_cooldown_seconds_; }

    // Setters
    void setApiAddress(const std::string& addr) { api_address_ = addr; }

    void reset();

private:
    Config();

    JobOptions options_;
    std::string api_address_ = "localhost:50051";
    int dns_refresh_seconds_ = DEFAULT_DNS_REFRESH_SECONDS;
    int dns_failure_threshold_ = DEFAULT_DNS_FAILURE_THRESHOLD;
    int dns_cooldown_seconds_ = DEFAULT_DNS_COOLDOWN_SECONDS;
};

// Upload statistics for one agent instance
class Metrics {
public:
    void incrementChunksAcked() { chunks_acked_++; }
    void incrementAttempts() { attempts_++; }
    void incrementRetries() { retries_++; }
    void addWireBytes(int64_t bytes) { wire_bytes_ += bytes; }
    void addRawBytes(int64_t bytes) { raw_bytes_ += bytes; }

    void recordChunkTime(int64_t milliseconds);

    int64_t getChunksAcked() const { return chunks_acked_; }
    int64_t getAttempts() const { return attempts_; }
    int64_t getRetries() const { return retries_; }
    int64_t getWireBytes() const { return wire_bytes_; }
    int64_t getRawBytes() const { return raw_bytes_; }
    double getAverageChunkTime() const;

    // Export metrics as JSON
    std::string toJSON() const;

private:
    std::atomic<int64_t> chunks_acked_{0};
    std::atomic<int64_t> attempts_{0};
    std::atomic<int64_t> retries_{0};
    std::atomic<int64_t> wire_bytes_{0};
    std::atomic<int64_t> raw_bytes_{0};

    std::vector<int64_t> chunk_times_;
    mutable std::mutex timing_mutex_;
};

} // namespace ua

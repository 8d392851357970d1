#include "utils.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace ua {

std::atomic<bool> Utils::verbose_{false};
std::mutex Utils::log_mutex_;

bool Utils::fileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

int64_t Utils::getFileSize(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        return st.st_size;
    }
    return -1;
}

int64_t Utils::getFileModifiedTime(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return static_cast<int64_t>(st.st_mtime);
    }
    return -1;
}

std::string Utils::absolutePath(const std::string& path) {
    char resolved[PATH_MAX];
    if (realpath(path.c_str(), resolved) != nullptr) {
        return resolved;
    }
    return path;
}

std::vector<std::string> Utils::splitString(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string Utils::joinStrings(const std::vector<std::string>& strings, const std::string& delimiter) {
    if (strings.empty()) return "";

    std::string result = strings[0];
    for (size_t i = 1; i < strings.size(); ++i) {
        result += delimiter + strings[i];
    }
    return result;
}

std::string Utils::trim(const std::string& str) {
    auto begin = str.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(begin, end - begin + 1);
}

std::string Utils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

int64_t Utils::parseSize(const std::string& value) {
    std::string v = trim(value);
    if (v.empty()) return -1;

    int64_t multiplier = 1;
    char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(v.back())));
    if (suffix == 'K' || suffix == 'M' || suffix == 'G') {
        multiplier = suffix == 'K' ? 1024LL : suffix == 'M' ? 1024LL * 1024 : 1024LL * 1024 * 1024;
        v.pop_back();
    }
    if (v.empty() || !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return -1;
    }
    try {
        int64_t number = std::stoll(v);
        if (number > INT64_MAX / multiplier) return -1;
        return number * multiplier;
    } catch (const std::exception&) {
        return -1;
    }
}

bool Utils::parseBool(const std::string& value) {
    std::string v = toLower(trim(value));
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

std::string Utils::formatFileSize(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string Utils::formatDuration(int64_t milliseconds) {
    std::ostringstream oss;
    if (milliseconds < 1000) {
        oss << milliseconds << "ms";
    } else if (milliseconds < 60000) {
        oss << std::fixed << std::setprecision(1) << milliseconds / 1000.0 << "s";
    } else {
        int64_t seconds = milliseconds / 1000;
        oss << seconds / 60 << "m " << seconds % 60 << "s";
    }
    return oss.str();
}

int64_t Utils::getCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string Utils::timestampToString(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp / 1000);
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << (timestamp % 1000);
    return oss.str();
}

void Utils::writeLog(const char* level, const std::string& message, bool to_stderr) {
    std::string line = std::string("[") + level + "] " + timestampToString(getCurrentTimestamp()) + " " + message;
    std::lock_guard<std::mutex> lock(log_mutex_);
    (to_stderr ? std::cerr : std::cout) << line << std::endl;
}

void Utils::logInfo(const std::string& message) {
    writeLog("INFO", message, false);
}

void Utils::logWarning(const std::string& message) {
    writeLog("WARN", message, false);
}

void Utils::logError(const std::string& message) {
    writeLog("ERROR", message, true);
}

void Utils::logDebug(const std::string& message) {
    #ifdef DEBUG
    writeLog("DEBUG", message, false);
    #else
    if (verbose_) {
        writeLog("DEBUG", message, false);
    }
    #endif
}

Status JobOptions::validate(int64_t file_size) const {
    if (chunk_size <= 0) {
        return Status(ErrorCode::ConfigurationError, "chunk size must be > 0");
    }
    if (chunk_size > MAX_CHUNK_SIZE) {
        return Status(ErrorCode::ConfigurationError,
                      "chunk size " + std::to_string(chunk_size) + " exceeds the service maximum of " +
                      std::to_string(MAX_CHUNK_SIZE));
    }
    if (file_size < 0) {
        return Status(ErrorCode::ConfigurationError, "file size must not be negative");
    }
    if (file_size == 0 && !allow_empty_file) {
        return Status(ErrorCode::ConfigurationError, "empty files are not allowed");
    }
    if ((file_size + chunk_size - 1) / chunk_size > MAX_CHUNK_COUNT) {
        return Status(ErrorCode::ConfigurationError,
                      "file would need more than " + std::to_string(MAX_CHUNK_COUNT) +
                      " chunks; increase the chunk size");
    }
    if (threads <= 0) {
        return Status(ErrorCode::ConfigurationError, "worker count must be > 0");
    }
    if (tries <= 0) {
        return Status(ErrorCode::ConfigurationError, "tries must be > 0");
    }
    if (max_slot_refreshes < 0) {
        return Status(ErrorCode::ConfigurationError, "max slot refreshes must not be negative");
    }
    if (compress && (compression_level < 1 || compression_level > 9)) {
        return Status(ErrorCode::ConfigurationError, "compression level must be in 1..9");
    }
    if (backoff_initial_ms < 0 || backoff_max_ms < backoff_initial_ms) {
        return Status(ErrorCode::ConfigurationError, "invalid backoff range");
    }
    if (http_timeout_ms <= 0 || api_timeout_ms <= 0) {
        return Status(ErrorCode::ConfigurationError, "timeouts must be > 0");
    }
    if (deadline_seconds < 0) {
        return Status(ErrorCode::ConfigurationError, "deadline must not be negative");
    }
    return Status::OK();
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    reset();
}

void Config::reset() {
    options_ = JobOptions();
    options_.threads = std::max(1u, std::thread::hardware_concurrency());
    api_address_ = "localhost:50051";
    dns_refresh_seconds_ = DEFAULT_DNS_REFRESH_SECONDS;
    dns_failure_threshold_ = DEFAULT_DNS_FAILURE_THRESHOLD;
    dns_cooldown_seconds_ = DEFAULT_DNS_COOLDOWN_SECONDS;
}

bool Config::loadFromFile(const std::string& configFile) {
    // Simple key-value configuration parser
    std::ifstream file(configFile);
    if (!file.is_open()) {
        Utils::logWarning("Could not open config file: " + configFile);
        return false;
    }

    bool ok = true;
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = Utils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            Utils::logWarning(configFile + ":" + std::to_string(line_number) + ": expected key = value");
            ok = false;
            continue;
        }

        std::string key = Utils::trim(line.substr(0, pos));
        std::string value = Utils::trim(line.substr(pos + 1));
        if (!set(key, value)) {
            Utils::logWarning(configFile + ":" + std::to_string(line_number) +
                              ": ignoring invalid setting '" + key + "'");
            ok = false;
        }
    }

    return ok;
}

bool Config::set(const std::string& key, const std::string& value) {
    auto toInt = [&value](int& out) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size()) return false;
            out = parsed;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    };

    if (key == "api_address") {
        api_address_ = value;
    } else if (key == "chunk_size") {
        int64_t size = Utils::parseSize(value);
        if (size < 0) return false;
        options_.chunk_size = size;
    } else if (key == "compress") {
        options_.compress = Utils::parseBool(value);
    } else if (key == "compression_level") {
        return toInt(options_.compression_level);
    } else if (key == "threads") {
        return toInt(options_.threads);
    } else if (key == "tries") {
        return toInt(options_.tries);
    } else if (key == "max_slot_refreshes") {
        return toInt(options_.max_slot_refreshes);
    } else if (key == "backoff_initial_ms") {
        return toInt(options_.backoff_initial_ms);
    } else if (key == "backoff_max_ms") {
        return toInt(options_.backoff_max_ms);
    } else if (key == "http_timeout_ms") {
        return toInt(options_.http_timeout_ms);
    } else if (key == "api_timeout_ms") {
        return toInt(options_.api_timeout_ms);
    } else if (key == "deadline_seconds") {
        return toInt(options_.deadline_seconds);
    } else if (key == "state_file") {
        options_.state_file = value;
    } else if (key == "allow_empty_file") {
        options_.allow_empty_file = Utils::parseBool(value);
    } else if (key == "slot_expired_status") {
        return toInt(options_.slot_expired_status);
    } else if (key == "dns_refresh_seconds") {
        return toInt(dns_refresh_seconds_);
    } else if (key == "dns_failure_threshold") {
        return toInt(dns_failure_threshold_);
    } else if (key == "dns_cooldown_seconds") {
        return toInt(dns_cooldown_seconds_);
    } else {
        return false;
    }
    return true;
}

void Metrics::recordChunkTime(int64_t milliseconds) {
    std::lock_guard<std::mutex> lock(timing_mutex_);
    chunk_times_.push_back(milliseconds);
}

double Metrics::getAverageChunkTime() const {
    std::lock_guard<std::mutex> lock(timing_mutex_);
    if (chunk_times_.empty()) return 0.0;

    int64_t sum = 0;
    for (auto time : chunk_times_) {
        sum += time;
    }
    return static_cast<double>(sum) / chunk_times_.size();
}

std::string Metrics::toJSON() const {
    std::stringstream ss;
    ss << "{\n";
    ss << "  \"chunks_acked\": " << chunks_acked_ << ",\n";
    ss << "  \"attempts\": " << attempts_ << ",\n";
    ss << "  \"retries\": " << retries_ << ",\n";
    ss << "  \"raw_bytes\": " << raw_bytes_ << ",\n";
    ss << "  \"wire_bytes\": " << wire_bytes_ << ",\n";
    ss << "  \"average_chunk_time_ms\": " << getAverageChunkTime() << "\n";
    ss << "}";
    return ss.str();
}

} // namespace ua

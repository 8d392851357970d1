#include "resume_store.h"
#include "checksum.h"
#include "utils.h"

#include <json/json.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

namespace ua {

namespace {

// Missing or corrupt state is never fatal: the job just starts from scratch
bool readDocument(const std::string& path, Json::Value* root) {
    std::ifstream file(path);
    if (!file.is_open()) {
        *root = Json::Value(Json::objectValue);
        return true;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string data = buffer.str();

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(data.c_str(), data.c_str() + data.size(), root, &errors) ||
        !root->isObject()) {
        Utils::logWarning("Ignoring unreadable resume state " + path + ": " + errors);
        *root = Json::Value(Json::objectValue);
        return false;
    }
    return true;
}

bool writeDocument(const std::string& path, const Json::Value& root) {
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            Utils::logError("Could not write resume state " + temp_path);
            return false;
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        file << Json::writeString(builder, root);
        if (!file.good()) {
            Utils::logError("Short write on resume state " + temp_path);
            return false;
        }
    }
    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        Utils::logError("Could not replace resume state " + path);
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

} // namespace

ResumeStore::ResumeStore(std::string path) : path_(std::move(path)) {
}

std::string ResumeStore::jobKey(const std::string& file_id, const std::string& absolute_path,
                                int64_t file_size, int64_t modified_time,
                                int64_t chunk_size, bool compress) {
    std::string identity = file_id + "|" + absolute_path + "|" + std::to_string(file_size) + "|" +
                           std::to_string(modified_time) + "|" + std::to_string(chunk_size) + "|" +
                           (compress ? "gzip" : "raw");
    return Checksum::md5Hex(identity);
}

std::optional<ResumeRecord> ResumeStore::load(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Json::Value root;
    readDocument(path_, &root);
    if (!root.isMember(key)) {
        return std::nullopt;
    }

    const Json::Value& job_json = root[key];
    ResumeRecord record;
    try {
        record.file_id = job_json["file_id"].asString();
        record.local_path = job_json["local_path"].asString();
        record.file_size = job_json["file_size"].asInt64();
        record.chunk_size = job_json["chunk_size"].asInt64();

        for (const Json::Value& chunk_json : job_json["chunks"]) {
            int index = chunk_json["index"].asInt();
            if (index < 0) continue;
            if (index >= MAX_CHUNK_COUNT) {
                Utils::logWarning("Ignoring malformed resume entry " + key + ": chunk index " +
                                  std::to_string(index) + " out of range");
                return std::nullopt;
            }
            if (static_cast<size_t>(index) >= record.chunks.size()) {
                record.chunks.resize(static_cast<size_t>(index) + 1);
            }
            ChunkOutcome& outcome = record.chunks[index];
            auto status = chunkStatusFromName(chunk_json["status"].asString());
            outcome.status = status ? *status : ChunkStatus::Pending;
            outcome.attempts = chunk_json["attempts"].asInt();
            outcome.payload_size = chunk_json["payload_size"].asInt64();
            outcome.compressed = chunk_json["compressed"].asBool();
            outcome.md5 = chunk_json["md5"].asString();
        }
    } catch (const Json::Exception& e) {
        Utils::logWarning("Ignoring malformed resume entry " + key + ": " + e.what());
        return std::nullopt;
    }
    return record;
}

bool ResumeStore::save(const std::string& key, const ResumeRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked(key, record);
}

bool ResumeStore::saveIfNewer(const std::string& key, const ResumeRecord& record, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_sequence_.find(key);
    if (it != last_sequence_.end() && sequence <= it->second) {
        return true;
    }
    if (!saveLocked(key, record)) {
        return false;
    }
    last_sequence_[key] = sequence;
    return true;
}

bool ResumeStore::saveLocked(const std::string& key, const ResumeRecord& record) {
    Json::Value root;
    readDocument(path_, &root);

    Json::Value job_json;
    job_json["file_id"] = record.file_id;
    job_json["local_path"] = record.local_path;
    job_json["file_size"] = static_cast<Json::Int64>(record.file_size);
    job_json["chunk_size"] = static_cast<Json::Int64>(record.chunk_size);
    job_json["updated_at"] = static_cast<Json::Int64>(Utils::getCurrentTimestamp());

    Json::Value chunks_json(Json::arrayValue);
    for (size_t i = 0; i < record.chunks.size(); ++i) {
        const ChunkOutcome& outcome = record.chunks[i];
        Json::Value chunk_json;
        chunk_json["index"] = static_cast<int>(i);
        chunk_json["status"] = chunkStatusName(outcome.status);
        chunk_json["attempts"] = outcome.attempts;
        chunk_json["payload_size"] = static_cast<Json::Int64>(outcome.payload_size);
        chunk_json["compressed"] = outcome.compressed;
        chunk_json["md5"] = outcome.md5;
        if (!outcome.last_error.ok()) {
            chunk_json["last_error"] = outcome.last_error.toString();
        }
        chunks_json.append(chunk_json);
    }
    job_json["chunks"] = chunks_json;
    root[key] = job_json;

    return writeDocument(path_, root);
}

bool ResumeStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_sequence_.erase(key);
    Json::Value root;
    readDocument(path_, &root);
    if (!root.isMember(key)) {
        return true;
    }
    root.removeMember(key);
    return writeDocument(path_, root);
}

} // namespace ua

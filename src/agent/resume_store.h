#pragma once

#include "chunk_state.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ua {

struct ResumeRecord {
    std::string file_id;
    std::string local_path;
    int64_t file_size = 0;
    int64_t chunk_size = 0;
    std::vector<ChunkOutcome> chunks;
};

// Local JSON file mapping file job identity -> per-chunk outcome table.
// Rewritten atomically (temp file + rename) on every save so a crash never
// leaves a half-written document behind.
class ResumeStore {
public:
    explicit ResumeStore(std::string path);

    // Stable identity of one upload job; changes if the source file, the
    // destination or the chunk layout changes.
    static std::string jobKey(const std::string& file_id, const std::string& absolute_path,
                              int64_t file_size, int64_t modified_time,
                              int64_t chunk_size, bool compress);

    std::optional<ResumeRecord> load(const std::string& key) const;
    bool save(const std::string& key, const ResumeRecord& record);
    // Saves only if sequence is newer than the last one saved for key, so
    // snapshots taken in order are never persisted out of order. A skipped
    // save counts as success.
    bool saveIfNewer(const std::string& key, const ResumeRecord& record, uint64_t sequence);
    bool remove(const std::string& key);

    const std::string& path() const { return path_; }

private:
    bool saveLocked(const std::string& key, const ResumeRecord& record);

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> last_sequence_;
};

} // namespace ua

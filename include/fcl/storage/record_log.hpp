#pragma once

#include <fcl/result.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace fcl {

namespace fs = std::filesystem;

/**
 * Outcome of replaying a record log.
 */
struct ReplayStats {
    size_t records = 0;          // Intact records delivered to the visitor
    uint64_t truncated_bytes = 0; // Torn or corrupt tail removed from the file
};

/**
 * RecordLog - Durable, append-only sequence of opaque records.
 *
 * File layout:
 *   [magic:8]
 *   repeated: [payload_len:4][crc32(payload):4][payload:*]
 *
 * Each append is written and flushed before returning. A crash in the
 * middle of an append leaves a short or mismatching frame at the tail;
 * replay() stops there and truncates the file back to the last intact
 * record so later appends start from a clean boundary.
 */
class RecordLog {
public:
    /**
     * Open or create a record log.
     *
     * @param path Log file path (parent directories are created)
     * @return The opened log, STORAGE_ERROR if it cannot be created,
     *         CORRUPTION if the file exists but is not a record log
     */
    static Result<std::unique_ptr<RecordLog>> open(const fs::path& path);

    ~RecordLog();

    RecordLog(const RecordLog&) = delete;
    RecordLog& operator=(const RecordLog&) = delete;

    /**
     * Deliver every intact record, oldest first.
     */
    Result<ReplayStats> replay(const std::function<void(const std::string&)>& visit);

    /**
     * Append one record and flush it to the file.
     */
    Result<void> append(const std::string& payload);

    /**
     * Atomically replace the whole log with the given records
     * (written to a sibling temp file, then renamed over the log).
     */
    Result<void> rewrite(const std::vector<std::string>& payloads);

    const fs::path& path() const { return path_; }

private:
    explicit RecordLog(fs::path path) : path_(std::move(path)) {}

    Result<void> open_for_append();

    fs::path path_;
    std::ofstream out_;
};

}  // namespace fcl

#pragma once

#include <fcl/types.hpp>
#include <fcl/result.hpp>
#include <fcl/storage/record_log.hpp>
#include <fcl/util/logger.hpp>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace fcl {

/**
 * FileIndex - Persistent cache of content fingerprints, keyed by path.
 *
 * Every upsert is appended to a record log; on open the log is replayed and
 * the last record per path wins. The filesystem stays authoritative: an
 * entry only says what a path contained when it was last hashed.
 */
class FileIndex {
public:
    static Result<std::unique_ptr<FileIndex>> open(const fs::path& path, Logger& logger);

    FileIndex(const FileIndex&) = delete;
    FileIndex& operator=(const FileIndex&) = delete;

    /**
     * Insert or replace the entry for entry.path.
     */
    Result<void> upsert(const IndexEntry& entry);

    std::optional<IndexEntry> get(const fs::path& path) const;

    /**
     * All entries, ordered by path.
     */
    std::vector<IndexEntry> entries() const;

    size_t size() const { return entries_.size(); }

    /**
     * Rewrite the log with one record per live path.
     */
    Result<void> compact();

private:
    FileIndex(std::unique_ptr<RecordLog> log, Logger& logger)
        : log_(std::move(log)), logger_(logger) {}

    static std::string serialize(const IndexEntry& entry);
    static std::optional<IndexEntry> deserialize(const std::string& data);

    std::unique_ptr<RecordLog> log_;
    Logger& logger_;
    std::map<std::string, IndexEntry> entries_;
    size_t record_count_ = 0;
};

}  // namespace fcl

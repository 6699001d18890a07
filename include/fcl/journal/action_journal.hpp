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
 * ActionJournal - Durable, append-only record of completed mutations.
 *
 * Each move/rename/delete that actually happened on disk gets exactly one
 * entry. Entries are removed once they have been reversed (or declared
 * unrestorable); removal is itself an appended record, so the log file is
 * only ever extended, except for compaction which rewrites it atomically.
 *
 * Ordering: entries are returned newest first, by descending timestamp and
 * then by descending id. Timestamps never go backwards within one journal
 * even if the system clock does.
 */
class ActionJournal {
public:
    /**
     * Open or create a journal and replay its log.
     *
     * @param path Journal file path
     * @param logger Sink for recovery and compaction notices
     * @param max_entries Cap on live entries; oldest are dropped past it (0 = unbounded)
     * @return The opened journal, or STORAGE_ERROR / CORRUPTION
     */
    static Result<std::unique_ptr<ActionJournal>> open(const fs::path& path,
                                                       Logger& logger,
                                                       size_t max_entries = 0);

    ActionJournal(const ActionJournal&) = delete;
    ActionJournal& operator=(const ActionJournal&) = delete;

    /**
     * Durably record one completed mutation.
     * Must only be called after the filesystem change succeeded.
     *
     * @return The new entry id, or STORAGE_ERROR
     */
    Result<ActionId> append(ActionKind kind,
                            const fs::path& source,
                            const std::optional<fs::path>& destination,
                            const std::string& metadata = "");

    /**
     * Up to n entries (all when n is empty), newest first.
     */
    std::vector<ActionEntry> most_recent(std::optional<size_t> n) const;

    /**
     * Read-only audit view; same ordering as most_recent().
     */
    std::vector<ActionEntry> history(std::optional<size_t> limit) const {
        return most_recent(limit);
    }

    /**
     * Remove entries by id. Unknown ids are ignored.
     */
    Result<void> remove(const std::vector<ActionId>& ids);

    /**
     * Rewrite the log keeping only live entries.
     */
    Result<void> compact();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const fs::path& path() const { return log_->path(); }

private:
    ActionJournal(std::unique_ptr<RecordLog> log, Logger& logger, size_t max_entries)
        : log_(std::move(log)), logger_(logger), max_entries_(max_entries) {}

    // Apply one replayed record to the in-memory view
    void apply(const std::string& payload);

    Result<void> compact_if_needed();
    Result<void> enforce_cap();

    std::unique_ptr<RecordLog> log_;
    Logger& logger_;
    size_t max_entries_;

    std::map<ActionId, ActionEntry> entries_;  // live entries by id
    size_t record_count_ = 0;                  // records currently in the file
    size_t stale_base_ = 0;                    // watermark records that never go stale
    ActionId next_id_ = 1;
    TimePoint last_timestamp_{};
};

}  // namespace fcl

#pragma once

#include <fcl/categorizer.hpp>
#include <fcl/file_walker.hpp>
#include <fcl/index/file_index.hpp>
#include <fcl/journal/action_journal.hpp>
#include <fcl/journal/undo_engine.hpp>
#include <fcl/report.hpp>
#include <fcl/result.hpp>
#include <fcl/safe_mover.hpp>
#include <fcl/types.hpp>
#include <fcl/util/logger.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fcl {

// One move_by_rules() rule: files whose name matches pattern go to destination
struct MoveRule {
    std::string pattern;    // ECMAScript regex, searched within the file name
    fs::path destination;   // Relative paths resolve against the processed directory
};

/**
 * FileManager - Batch file operations with a reversible history.
 *
 * Every move, rename and delete that succeeds on disk is appended to the
 * action journal right after it happens, in directory-walk order. Dry runs
 * classify and match exactly like live runs but never touch the filesystem
 * or the journal, so their results can be trusted as previews.
 *
 * Directory-level problems (missing root, bad argument) fail the whole call
 * before anything is changed. Problems with one file are logged and that
 * file is skipped; the rest of the batch still runs.
 */
class FileManager {
public:
    /**
     * Open the journal and index named by config.
     *
     * @param config Engine configuration
     * @param logger Log sink (a NullLogger when empty)
     * @param walker Directory walker (a FilesystemWalker when empty)
     * @return The manager, or STORAGE_ERROR / CORRUPTION from the stores
     */
    static Result<std::unique_ptr<FileManager>> open(const Config& config,
                                                     std::shared_ptr<Logger> logger = nullptr,
                                                     std::unique_ptr<FileWalker> walker = nullptr);

    FileManager(const FileManager&) = delete;
    FileManager& operator=(const FileManager&) = delete;

    // ========================================================================
    // Organizing
    // ========================================================================

    /**
     * Move each file into <directory>/<category>/ for the given dimension.
     * Files already inside their category folder stay where they are.
     *
     * @return Category -> original paths, in walk order
     */
    Result<std::map<std::string, std::vector<fs::path>>> sort(const fs::path& directory,
                                                              Dimension dimension,
                                                              bool recursive = false,
                                                              bool dry_run = false);

    /**
     * Rename files whose name changes under regex substitution.
     * replacement may reference groups as $1, $2, ...
     *
     * @return Old path -> intended new path; INVALID_ARGUMENT on a bad pattern
     */
    Result<std::map<fs::path, fs::path>> rename_batch(const fs::path& directory,
                                                      const std::string& pattern,
                                                      const std::string& replacement,
                                                      bool recursive = false,
                                                      bool dry_run = false);

    /**
     * Move files to the destination of the first rule whose pattern matches
     * their name. Invalid patterns are logged and ignored.
     *
     * @return Destination (as given in the rule) -> original paths
     */
    Result<std::map<std::string, std::vector<fs::path>>> move_by_rules(
        const fs::path& directory,
        const std::vector<MoveRule>& rules,
        bool recursive = false,
        bool dry_run = false);

    // ========================================================================
    // Duplicates
    // ========================================================================

    /**
     * Group files under all roots by content fingerprint. Always recursive.
     * Each hashed file is upserted into the fingerprint index.
     *
     * @return Fingerprint -> paths, only for groups of two or more
     */
    Result<std::map<std::string, std::vector<fs::path>>> find_duplicates(
        const std::vector<fs::path>& directories);

    // ========================================================================
    // Cleaning
    // ========================================================================

    /**
     * Delete files whose lowercase name starts or ends with a temp marker
     * (~$ .tmp .temp .swp .bak .old .cache).
     */
    Result<std::vector<fs::path>> clean_temp_files(const fs::path& directory,
                                                   bool recursive = true,
                                                   bool dry_run = false);

    /**
     * Delete files last modified more than days * 86400 seconds ago.
     * INVALID_ARGUMENT if days is negative.
     */
    Result<std::vector<fs::path>> clean_old_files(const fs::path& directory,
                                                  int days,
                                                  bool recursive = true,
                                                  bool dry_run = false);

    static bool is_temp_file(const fs::path& path);

    // ========================================================================
    // Reporting
    // ========================================================================

    Result<ReportStats> collect_stats(const fs::path& directory, bool recursive = true);

    Result<std::string> generate_report(const fs::path& directory,
                                        bool recursive = true,
                                        ReportFormat format = ReportFormat::TEXT,
                                        bool human_readable = true);

    // ========================================================================
    // History
    // ========================================================================

    /**
     * Journal entries, newest first.
     */
    std::vector<ActionEntry> get_action_history(std::optional<size_t> limit = std::nullopt) const;

    /**
     * Reverse the count most recent actions (all when empty).
     */
    UndoReport undo(std::optional<size_t> count = 1);

    const Config& config() const { return config_; }
    const Categorizer& categorizer() const { return categorizer_; }
    const FileIndex& file_index() const { return *index_; }

private:
    FileManager(const Config& config,
                std::shared_ptr<Logger> logger,
                std::unique_ptr<FileWalker> walker);

    // Snapshot of the walk so later mutations cannot disturb iteration
    Result<std::vector<FileRecord>> collect(const fs::path& directory, bool recursive) const;

    // Journal a completed mutation; a failure is logged, never returned
    void record(ActionKind kind, const fs::path& source, const std::optional<fs::path>& destination);

    // Move one file and journal it; failures are logged and the file skipped
    void relocate(ActionKind kind, const fs::path& source, const fs::path& destination);

    // Delete one file and journal it
    void remove_file(const fs::path& path);

    Config config_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<FileWalker> walker_;
    Categorizer categorizer_;
    SafeMover mover_;
    std::unique_ptr<ActionJournal> journal_;
    std::unique_ptr<FileIndex> index_;
};

}  // namespace fcl

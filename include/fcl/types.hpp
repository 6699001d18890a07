#pragma once

#include <fcl/core_types.hpp>
#include <fcl/util/logger.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fcl {

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * A file as seen by one walk. Computed on demand, never persisted.
 */
struct FileRecord {
    fs::path path;
    uint64_t size = 0;
    TimePoint modified_at;
    std::optional<std::string> category;     // Set once classified
    std::optional<std::string> fingerprint;  // Set once hashed
};

/**
 * One completed filesystem mutation, as stored in the action journal.
 */
struct ActionEntry {
    ActionId id = INVALID_ACTION_ID;
    ActionKind kind = ActionKind::MOVE;
    fs::path source;
    std::optional<fs::path> destination;  // Absent for deletes
    TimePoint created_at;
    std::string metadata;                 // Reserved
};

/**
 * Cached fingerprint of a previously hashed path.
 */
struct IndexEntry {
    fs::path path;
    std::string fingerprint;
    uint64_t size = 0;
    TimePoint modified_at;
    std::string type;
    TimePoint indexed_at;
};

// Extensions (lowercase, with leading dot) that map to one type category
struct TypeRule {
    std::string type;
    std::vector<std::string> extensions;
};

// Size category; files strictly smaller than upper_bound fall in it.
// An absent bound marks the open-ended bucket.
struct SizeBucket {
    std::string label;
    std::optional<uint64_t> upper_bound;
};

/**
 * Engine configuration, injected into each component at construction.
 */
struct Config {
    fs::path data_directory;
    fs::path journal_path;
    fs::path index_path;
    fs::path log_file;

    std::vector<TypeRule> type_rules;
    std::vector<SizeBucket> size_buckets;

    std::string default_sort_criteria = "type";
    LogLevel log_level = LogLevel::INFO;
    bool use_colors = true;
    bool confirm_actions = true;
    size_t max_undo_history = 0;    // 0 = unbounded
};

/**
 * Built-in defaults rooted at the given data directory.
 */
Config default_config(const fs::path& data_directory);

/**
 * Default data directory (~/.local/share/fcl).
 */
fs::path default_data_directory();

}  // namespace fcl

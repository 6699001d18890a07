#include <fcl/file_manager.hpp>
#include <fcl/content_hasher.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace fcl {

namespace {

const std::vector<std::string> TEMP_MARKERS = {
    "~$", ".tmp", ".temp", ".swp", ".bak", ".old", ".cache"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Directory-level precondition shared by every batch operation
Result<fs::path> resolve_root(const fs::path& directory) {
    std::error_code ec;
    fs::path root = fs::absolute(directory, ec);
    if (ec) {
        return Err(ec, "Cannot resolve " + directory.string());
    }
    auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        return Error(ErrorCode::NOT_FOUND, "Directory not found: " + directory.string());
    }
    if (!fs::is_directory(status)) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Not a directory: " + directory.string());
    }
    return root.lexically_normal();
}

}  // namespace

FileManager::FileManager(const Config& config,
                         std::shared_ptr<Logger> logger,
                         std::unique_ptr<FileWalker> walker)
    : config_(config),
      logger_(std::move(logger)),
      walker_(std::move(walker)),
      categorizer_(config),
      mover_(*logger_) {}

Result<std::unique_ptr<FileManager>> FileManager::open(const Config& config,
                                                       std::shared_ptr<Logger> logger,
                                                       std::unique_ptr<FileWalker> walker) {
    if (!logger) {
        logger = std::make_shared<NullLogger>();
    }
    if (!walker) {
        walker = std::make_unique<FilesystemWalker>(*logger);
    }

    auto manager = std::unique_ptr<FileManager>(
        new FileManager(config, std::move(logger), std::move(walker)));

    auto journal = ActionJournal::open(config.journal_path, *manager->logger_, config.max_undo_history);
    if (!journal.ok()) {
        return journal.error();
    }
    manager->journal_ = std::move(journal.value());

    auto index = FileIndex::open(config.index_path, *manager->logger_);
    if (!index.ok()) {
        return index.error();
    }
    manager->index_ = std::move(index.value());

    manager->logger_->debug("Journal " + config.journal_path.string() + " holds " +
                            std::to_string(manager->journal_->size()) + " actions");
    return std::move(manager);
}

// ============================================================================
// Helpers
// ============================================================================

Result<std::vector<FileRecord>> FileManager::collect(const fs::path& directory, bool recursive) const {
    std::vector<FileRecord> files;
    auto walked = walker_->walk(directory, recursive, [&files](const FileRecord& file) {
        files.push_back(file);
    });
    if (!walked.ok()) {
        return walked.error();
    }
    return files;
}

void FileManager::record(ActionKind kind,
                         const fs::path& source,
                         const std::optional<fs::path>& destination) {
    auto appended = journal_->append(kind, source, destination);
    if (!appended.ok()) {
        logger_->error("Could not journal " + std::string(to_string(kind)) + " of " +
                       source.string() + ", it cannot be undone: " + appended.error().to_string());
    }
}

void FileManager::relocate(ActionKind kind, const fs::path& source, const fs::path& destination) {
    auto moved = mover_.move(source, destination);
    if (!moved.ok()) {
        logger_->error("Failed to " + std::string(to_string(kind)) + " " + source.string() +
                       ": " + moved.error().to_string());
        return;
    }

    logger_->info(std::string(kind == ActionKind::RENAME ? "Renamed " : "Moved ") +
                  source.string() + " -> " + moved.value().string());
    record(kind, source, moved.value());
}

void FileManager::remove_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        Error error = ec ? Err(ec, "Cannot delete " + path.string())
                         : Error(ErrorCode::NOT_FOUND, "File vanished: " + path.string());
        logger_->error(error.to_string());
        return;
    }

    logger_->info("Deleted " + path.string());
    record(ActionKind::DELETE, path, std::nullopt);
}

// ============================================================================
// Organizing
// ============================================================================

Result<std::map<std::string, std::vector<fs::path>>> FileManager::sort(const fs::path& directory,
                                                                       Dimension dimension,
                                                                       bool recursive,
                                                                       bool dry_run) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    std::map<std::string, std::vector<fs::path>> result;
    const TimePoint now = Clock::now();

    for (const auto& file : files.value()) {
        std::string category = categorizer_.classify(file, dimension, now);
        result[category].push_back(file.path);

        if (dry_run) {
            continue;
        }

        fs::path target_dir = root.value() / category;
        if (file.path.parent_path() == target_dir) {
            continue;
        }
        relocate(ActionKind::MOVE, file.path, target_dir / file.path.filename());
    }

    logger_->info(std::string(dry_run ? "Would sort " : "Sorted ") +
                  std::to_string(files.value().size()) + " files by " + to_string(dimension));
    return result;
}

Result<std::map<fs::path, fs::path>> FileManager::rename_batch(const fs::path& directory,
                                                               const std::string& pattern,
                                                               const std::string& replacement,
                                                               bool recursive,
                                                               bool dry_run) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }

    std::regex regex;
    try {
        regex = std::regex(pattern);
    } catch (const std::regex_error& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid pattern '" + pattern + "': " + e.what());
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    std::map<fs::path, fs::path> result;

    for (const auto& file : files.value()) {
        std::string old_name = file.path.filename().string();
        std::string new_name;
        try {
            new_name = std::regex_replace(old_name, regex, replacement);
        } catch (const std::regex_error& e) {
            logger_->error("Pattern failed on " + file.path.string() + ": " + e.what());
            continue;
        }

        if (new_name == old_name) {
            continue;
        }
        if (new_name.empty() || new_name.find('/') != std::string::npos ||
            new_name == "." || new_name == "..") {
            logger_->warning("Skipping " + file.path.string() + ": replacement gives invalid name '" +
                             new_name + "'");
            continue;
        }

        fs::path new_path = file.path.parent_path() / new_name;
        result[file.path] = new_path;

        if (!dry_run) {
            relocate(ActionKind::RENAME, file.path, new_path);
        }
    }

    return result;
}

Result<std::map<std::string, std::vector<fs::path>>> FileManager::move_by_rules(
    const fs::path& directory,
    const std::vector<MoveRule>& rules,
    bool recursive,
    bool dry_run) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }

    struct CompiledRule {
        std::regex regex;
        const MoveRule* rule;
    };

    std::vector<CompiledRule> compiled;
    for (const auto& rule : rules) {
        try {
            compiled.push_back({std::regex(rule.pattern), &rule});
        } catch (const std::regex_error& e) {
            logger_->warning("Ignoring rule with invalid pattern '" + rule.pattern + "': " + e.what());
        }
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    std::map<std::string, std::vector<fs::path>> result;

    for (const auto& file : files.value()) {
        std::string name = file.path.filename().string();

        for (const auto& candidate : compiled) {
            if (!std::regex_search(name, candidate.regex)) {
                continue;
            }

            const fs::path& destination = candidate.rule->destination;
            result[destination.string()].push_back(file.path);

            if (!dry_run) {
                fs::path target_dir = destination.is_absolute()
                    ? destination.lexically_normal()
                    : (root.value() / destination).lexically_normal();
                if (file.path.parent_path() != target_dir) {
                    relocate(ActionKind::MOVE, file.path, target_dir / file.path.filename());
                }
            }
            break;  // first matching rule wins
        }
    }

    return result;
}

// ============================================================================
// Duplicates
// ============================================================================

Result<std::map<std::string, std::vector<fs::path>>> FileManager::find_duplicates(
    const std::vector<fs::path>& directories) {
    std::vector<fs::path> roots;
    for (const auto& directory : directories) {
        auto root = resolve_root(directory);
        if (!root.ok()) {
            return root.error();
        }
        roots.push_back(root.value());
    }

    std::map<std::string, std::vector<fs::path>> groups;
    std::set<fs::path> seen;  // overlapping roots visit the same file twice
    size_t hashed = 0;

    for (const auto& root : roots) {
        auto files = collect(root, true);
        if (!files.ok()) {
            return files.error();
        }

        for (const auto& file : files.value()) {
            if (!seen.insert(file.path).second) {
                continue;
            }
            auto fingerprint = ContentHasher::hash(file.path);
            if (!fingerprint.ok()) {
                logger_->error("Skipping " + file.path.string() + ": " + fingerprint.error().to_string());
                continue;
            }
            ++hashed;
            groups[fingerprint.value()].push_back(file.path);

            IndexEntry entry;
            entry.path = file.path;
            entry.fingerprint = fingerprint.value();
            entry.size = file.size;
            entry.modified_at = file.modified_at;
            entry.type = categorizer_.type_of(file.path);
            entry.indexed_at = Clock::now();

            auto indexed = index_->upsert(entry);
            if (!indexed.ok()) {
                logger_->warning("Index update failed for " + file.path.string() + ": " +
                                 indexed.error().to_string());
            }
        }
    }

    for (auto it = groups.begin(); it != groups.end();) {
        if (it->second.size() < 2) {
            it = groups.erase(it);
        } else {
            ++it;
        }
    }

    logger_->info("Hashed " + std::to_string(hashed) + " files, found " +
                  std::to_string(groups.size()) + " duplicate groups");
    return groups;
}

// ============================================================================
// Cleaning
// ============================================================================

bool FileManager::is_temp_file(const fs::path& path) {
    std::string name = to_lower(path.filename().string());
    for (const auto& marker : TEMP_MARKERS) {
        if (starts_with(name, marker) || ends_with(name, marker)) {
            return true;
        }
    }
    return false;
}

Result<std::vector<fs::path>> FileManager::clean_temp_files(const fs::path& directory,
                                                            bool recursive,
                                                            bool dry_run) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    std::vector<fs::path> removed;
    for (const auto& file : files.value()) {
        if (!is_temp_file(file.path)) {
            continue;
        }
        removed.push_back(file.path);
        if (!dry_run) {
            remove_file(file.path);
        }
    }
    return removed;
}

Result<std::vector<fs::path>> FileManager::clean_old_files(const fs::path& directory,
                                                           int days,
                                                           bool recursive,
                                                           bool dry_run) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }
    if (days < 0) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Day count must not be negative: " + std::to_string(days));
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    const TimePoint threshold = Clock::now() - std::chrono::seconds(days * SECONDS_PER_DAY);

    std::vector<fs::path> removed;
    for (const auto& file : files.value()) {
        if (file.modified_at >= threshold) {
            continue;
        }
        removed.push_back(file.path);
        if (!dry_run) {
            remove_file(file.path);
        }
    }
    return removed;
}

// ============================================================================
// Reporting
// ============================================================================

Result<ReportStats> FileManager::collect_stats(const fs::path& directory, bool recursive) {
    auto root = resolve_root(directory);
    if (!root.ok()) {
        return root.error();
    }

    auto files = collect(root.value(), recursive);
    if (!files.ok()) {
        return files.error();
    }

    ReportStats stats;
    stats.directory = root.value();
    const TimePoint now = Clock::now();

    for (const auto& file : files.value()) {
        stats.add(categorizer_.classify(file, Dimension::TYPE, now),
                  categorizer_.classify(file, Dimension::SIZE, now),
                  categorizer_.classify(file, Dimension::DATE, now),
                  file.size);
    }
    return stats;
}

Result<std::string> FileManager::generate_report(const fs::path& directory,
                                                 bool recursive,
                                                 ReportFormat format,
                                                 bool human_readable) {
    auto stats = collect_stats(directory, recursive);
    if (!stats.ok()) {
        return stats.error();
    }

    ReportRenderer renderer(categorizer_.size_labels(), Categorizer::date_labels());
    switch (format) {
        case ReportFormat::TEXT: return renderer.render_text(stats.value(), human_readable);
        case ReportFormat::JSON: return renderer.render_json(stats.value(), human_readable);
    }
    return Error(ErrorCode::INVALID_ARGUMENT, "Unknown report format");
}

// ============================================================================
// History
// ============================================================================

std::vector<ActionEntry> FileManager::get_action_history(std::optional<size_t> limit) const {
    return journal_->history(limit);
}

UndoReport FileManager::undo(std::optional<size_t> count) {
    UndoEngine engine(*journal_, mover_, *logger_);
    return engine.undo(count);
}

}  // namespace fcl

#include <fcl/journal/undo_engine.hpp>

namespace fcl {

UndoReport UndoEngine::undo(std::optional<size_t> count) {
    UndoReport report;

    size_t n = count.value_or(journal_.size());
    if (n == 0 || journal_.empty()) {
        logger_.info("Nothing to undo");
        return report;
    }

    std::vector<ActionId> to_remove;
    for (const auto& entry : journal_.most_recent(n)) {
        UndoOutcome outcome = reverse(entry);
        if (outcome.status != UndoStatus::FAILED) {
            to_remove.push_back(entry.id);
        }
        if (outcome.status == UndoStatus::RESTORED) {
            report.success = true;
        }
        report.outcomes.push_back(std::move(outcome));
    }

    if (!to_remove.empty()) {
        auto removed = journal_.remove(to_remove);
        if (!removed.ok()) {
            report.journal_updated = false;
            logger_.error("Failed to remove " + std::to_string(to_remove.size()) +
                          " undone entries from the journal: " + removed.error().to_string());
        }
    }

    logger_.info("Undo: " + std::to_string(report.count(UndoStatus::RESTORED)) + " restored, " +
                 std::to_string(report.count(UndoStatus::FAILED)) + " failed, " +
                 std::to_string(report.count(UndoStatus::UNRESTORABLE)) + " unrestorable");
    return report;
}

UndoOutcome UndoEngine::reverse(const ActionEntry& entry) {
    switch (entry.kind) {
        case ActionKind::MOVE:
        case ActionKind::RENAME:
            return reverse_relocation(entry);

        case ActionKind::DELETE: {
            std::string message = "Cannot restore deleted file " + entry.source.string();
            logger_.warning(message);
            return {entry, UndoStatus::UNRESTORABLE, message};
        }
    }
    return {entry, UndoStatus::FAILED, "Unknown action kind"};
}

UndoOutcome UndoEngine::reverse_relocation(const ActionEntry& entry) {
    if (!entry.destination.has_value()) {
        std::string message = "Entry " + std::to_string(entry.id) + " has no destination";
        logger_.error(message);
        return {entry, UndoStatus::FAILED, message};
    }
    const fs::path& destination = *entry.destination;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(destination, ec))) {
        std::string message = "Cannot undo " + std::string(to_string(entry.kind)) + ": " +
                              destination.string() + " no longer exists";
        logger_.error(message);
        return {entry, UndoStatus::FAILED, message};
    }
    if (fs::exists(fs::symlink_status(entry.source, ec))) {
        std::string message = "Cannot undo " + std::string(to_string(entry.kind)) + ": " +
                              entry.source.string() + " is occupied";
        logger_.error(message);
        return {entry, UndoStatus::FAILED, message};
    }

    auto moved = mover_.move_exact(destination, entry.source);
    if (!moved.ok()) {
        std::string message = "Failed to restore " + entry.source.string() + ": " +
                              moved.error().to_string();
        logger_.error(message);
        return {entry, UndoStatus::FAILED, message};
    }

    logger_.info("Restored " + destination.string() + " -> " + entry.source.string());
    return {entry, UndoStatus::RESTORED, ""};
}

}  // namespace fcl

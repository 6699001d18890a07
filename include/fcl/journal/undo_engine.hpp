#pragma once

#include <fcl/journal/action_journal.hpp>
#include <fcl/safe_mover.hpp>
#include <fcl/util/logger.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fcl {

enum class UndoStatus {
    RESTORED,       // File is back at its original path
    FAILED,         // Preconditions not met or move failed; entry kept
    UNRESTORABLE    // Deletion; entry dropped without restoring anything
};

inline const char* to_string(UndoStatus status) {
    switch (status) {
        case UndoStatus::RESTORED:     return "restored";
        case UndoStatus::FAILED:       return "failed";
        case UndoStatus::UNRESTORABLE: return "unrestorable";
    }
    return "unknown";
}

struct UndoOutcome {
    ActionEntry entry;
    UndoStatus status = UndoStatus::FAILED;
    std::string message;
};

/**
 * Result of one undo() call. success is true when at least one entry was
 * restored; outcomes lists every processed entry, newest first.
 */
struct UndoReport {
    bool success = false;
    std::vector<UndoOutcome> outcomes;
    bool journal_updated = true;   // false if the batch removal failed

    size_t count(UndoStatus status) const {
        size_t n = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.status == status) {
                ++n;
            }
        }
        return n;
    }
};

/**
 * UndoEngine - Reverses journaled actions, newest first.
 *
 * Processing is best-effort: a failing entry is logged and left in the
 * journal while the remaining entries are still attempted. Successful
 * reversals are never rolled back. Reversed and unrestorable entries are
 * removed from the journal in one batch at the end.
 */
class UndoEngine {
public:
    UndoEngine(ActionJournal& journal, const SafeMover& mover, Logger& logger)
        : journal_(journal), mover_(mover), logger_(logger) {}

    /**
     * Undo the count most recent entries, or all of them when count is empty.
     */
    UndoReport undo(std::optional<size_t> count);

private:
    UndoOutcome reverse(const ActionEntry& entry);
    UndoOutcome reverse_relocation(const ActionEntry& entry);

    ActionJournal& journal_;
    const SafeMover& mover_;
    Logger& logger_;
};

}  // namespace fcl

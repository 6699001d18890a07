#include "undo_command.hpp"

namespace fcl::cli {

void UndoCommand::setup(CLI::App& app) {
    auto* count = app.add_option("-n,--count", count_, "Number of actions to undo (default: 1)")
        ->type_name("N")
        ->check(CLI::PositiveNumber);

    app.add_flag("--all", all_, "Undo every recorded action")
        ->excludes(count);

    app.add_flag("-y,--yes", yes_, "Skip confirmation prompt for --all");
}

int UndoCommand::execute(CommandContext& ctx) {
    std::optional<size_t> count;
    if (!all_) {
        count = count_;
    }

    if (all_ && !yes_) {
        size_t pending = ctx.manager->get_action_history().size();
        if (pending > 0 && !confirm(ctx, "Undo all " + std::to_string(pending) + " action(s)?")) {
            std::cout << "Cancelled.\n";
            return FCL_EXIT_SUCCESS;
        }
    }

    UndoReport report = ctx.manager->undo(count);
    if (report.outcomes.empty()) {
        std::cout << "Nothing to undo.\n";
        return FCL_EXIT_SUCCESS;
    }

    for (const auto& outcome : report.outcomes) {
        const auto& entry = outcome.entry;
        std::cout << "  [" << to_string(outcome.status) << "] "
                  << to_string(entry.kind) << " " << entry.source.string();
        if (outcome.status == UndoStatus::RESTORED && entry.destination.has_value()) {
            std::cout << " <- " << entry.destination->string();
        }
        if (!outcome.message.empty() && ctx.verbose) {
            std::cout << " (" << outcome.message << ")";
        }
        std::cout << "\n";
    }

    if (!report.journal_updated) {
        std::cerr << "Error: the journal could not be updated; undone actions may be listed again\n";
        return FCL_EXIT_IO_ERROR;
    }

    if (!report.success) {
        std::cout << "No action could be undone.\n";
        return FCL_EXIT_IO_ERROR;
    }

    std::cout << report.count(UndoStatus::RESTORED) << " action(s) undone.\n";
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

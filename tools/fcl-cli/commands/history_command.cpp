#include "history_command.hpp"

#include <iomanip>

namespace fcl::cli {

void HistoryCommand::setup(CLI::App& app) {
    app.add_option("-n,--limit", limit_, "Show at most N entries (default: all)")
        ->type_name("N");
}

int HistoryCommand::execute(CommandContext& ctx) {
    std::optional<size_t> limit;
    if (limit_ > 0) {
        limit = limit_;
    }

    auto entries = ctx.manager->get_action_history(limit);
    if (entries.empty()) {
        std::cout << "No recorded actions.\n";
        return FCL_EXIT_SUCCESS;
    }

    std::cout << std::left
              << std::setw(8) << "ID"
              << std::setw(21) << "TIME"
              << std::setw(8) << "ACTION"
              << "PATH\n";
    std::cout << std::string(80, '-') << "\n";

    for (const auto& entry : entries) {
        std::cout << std::left
                  << std::setw(8) << entry.id
                  << std::setw(21) << format_time(entry.created_at)
                  << std::setw(8) << to_string(entry.kind)
                  << entry.source.string();
        if (entry.destination.has_value()) {
            std::cout << " -> " << entry.destination->string();
        }
        std::cout << "\n";
    }

    std::cout << "\n" << entries.size() << " action(s)\n";
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

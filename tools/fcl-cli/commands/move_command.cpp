#include "move_command.hpp"

namespace fcl::cli {

void MoveCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Directory to process")
        ->required()
        ->type_name("<dir>");

    app.add_option("--rule", rules_, "Regex and destination; first matching rule wins")
        ->required()
        ->type_name("PATTERN DEST");

    app.add_flag("-r,--recursive", recursive_, "Include subdirectories");
    app.add_flag("--dry-run", dry_run_, "Show what would be moved without moving");
}

int MoveCommand::execute(CommandContext& ctx) {
    std::vector<MoveRule> rules;
    rules.reserve(rules_.size());
    for (const auto& [pattern, destination] : rules_) {
        rules.push_back({pattern, destination});
    }

    auto result = ctx.manager->move_by_rules(directory_, rules, recursive_, dry_run_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    if (result.value().empty()) {
        std::cout << "No files matched any rule.\n";
        return FCL_EXIT_SUCCESS;
    }

    std::cout << "Moved files:\n";
    for (const auto& [destination, files] : result.value()) {
        std::cout << "  " << destination << ": " << files.size() << " file(s)\n";
        if (ctx.verbose) {
            for (const auto& file : files) {
                std::cout << "    - " << file.string() << "\n";
            }
        }
    }

    print_dry_run_notice(dry_run_, "moved");
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

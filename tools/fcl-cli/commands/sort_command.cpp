#include "sort_command.hpp"

namespace fcl::cli {

void SortCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Directory to sort")
        ->required()
        ->type_name("<dir>");

    app.add_option("-c,--criteria", criteria_, "Sort by type, size or date (default from config)")
        ->check(CLI::IsMember({"type", "size", "date"}));

    app.add_flag("-r,--recursive", recursive_, "Include subdirectories");
    app.add_flag("--dry-run", dry_run_, "Show what would be moved without moving");
}

int SortCommand::execute(CommandContext& ctx) {
    std::string criteria = criteria_.empty() ? ctx.config.default_sort_criteria : criteria_;
    auto dimension = parse_dimension(criteria);
    if (!dimension.ok()) {
        return report_error(dimension.error());
    }

    auto result = ctx.manager->sort(directory_, dimension.value(), recursive_, dry_run_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Files sorted by " << criteria << ":\n";
    for (const auto& [category, files] : result.value()) {
        std::cout << "  " << category << ": " << files.size() << " file(s)\n";
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

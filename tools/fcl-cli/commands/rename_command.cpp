#include "rename_command.hpp"

namespace fcl::cli {

void RenameCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Directory to process")
        ->required()
        ->type_name("<dir>");

    app.add_option("pattern", pattern_, "Regular expression matched against file names")
        ->required();

    app.add_option("replacement", replacement_, "Replacement text ($1, $2 for groups)")
        ->required();

    app.add_flag("-r,--recursive", recursive_, "Include subdirectories");
    app.add_flag("--dry-run", dry_run_, "Show new names without renaming");
}

int RenameCommand::execute(CommandContext& ctx) {
    auto result = ctx.manager->rename_batch(directory_, pattern_, replacement_, recursive_, dry_run_);
    if (!result.ok()) {
        return report_error(result.error());
    }

    if (result.value().empty()) {
        std::cout << "No file names match '" << pattern_ << "'.\n";
        return FCL_EXIT_SUCCESS;
    }

    std::cout << "Renamed files:\n";
    for (const auto& [old_path, new_path] : result.value()) {
        std::cout << "  " << old_path.filename().string() << " -> "
                  << new_path.filename().string() << "\n";
    }

    print_dry_run_notice(dry_run_, "renamed");
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

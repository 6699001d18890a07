#include "clean_command.hpp"

namespace fcl::cli {

namespace {

void print_files(const char* heading, const std::vector<std::filesystem::path>& files) {
    std::cout << heading << ": " << files.size() << " file(s)\n";
    for (const auto& file : files) {
        std::cout << "  - " << file.string() << "\n";
    }
}

}  // namespace

void CleanCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Directory to clean")
        ->required()
        ->type_name("<dir>");

    app.add_flag("--temp", temp_, "Delete temporary files (~$*, *.tmp, *.bak, ...)");
    old_option_ = app.add_option("--old", old_days_, "Delete files not modified for DAYS days")
        ->type_name("DAYS");

    app.add_flag("--no-recursive", no_recursive_, "Only the top-level directory");
    app.add_flag("--dry-run", dry_run_, "List files without deleting");
    app.add_flag("-y,--yes", yes_, "Skip confirmation prompt");

    // At least one of --temp / --old
    app.callback([this]() {
        if (!temp_ && old_option_->count() == 0) {
            throw CLI::ValidationError("clean", "specify --temp and/or --old DAYS");
        }
    });
}

int CleanCommand::execute(CommandContext& ctx) {
    bool recursive = !no_recursive_;
    bool old = old_option_->count() > 0;

    // Preview first so the prompt can say what will go
    std::vector<std::filesystem::path> temp_files;
    std::vector<std::filesystem::path> old_files;
    if (temp_) {
        auto preview = ctx.manager->clean_temp_files(directory_, recursive, true);
        if (!preview.ok()) {
            return report_error(preview.error());
        }
        temp_files = std::move(preview.value());
    }
    if (old) {
        auto preview = ctx.manager->clean_old_files(directory_, old_days_, recursive, true);
        if (!preview.ok()) {
            return report_error(preview.error());
        }
        old_files = std::move(preview.value());
    }

    if (temp_files.empty() && old_files.empty()) {
        std::cout << "Nothing to clean.\n";
        return FCL_EXIT_SUCCESS;
    }

    if (dry_run_) {
        if (temp_) print_files("Temporary files", temp_files);
        if (old) print_files("Old files", old_files);
        print_dry_run_notice(true, "deleted");
        return FCL_EXIT_SUCCESS;
    }

    size_t total = temp_files.size() + old_files.size();
    if (!yes_ && !confirm(ctx, "Delete " + std::to_string(total) + " file(s)?")) {
        std::cout << "Cancelled.\n";
        return FCL_EXIT_SUCCESS;
    }

    if (temp_) {
        auto removed = ctx.manager->clean_temp_files(directory_, recursive, false);
        if (!removed.ok()) {
            return report_error(removed.error());
        }
        print_files("Temporary files", removed.value());
    }
    if (old) {
        auto removed = ctx.manager->clean_old_files(directory_, old_days_, recursive, false);
        if (!removed.ok()) {
            return report_error(removed.error());
        }
        print_files("Old files", removed.value());
    }
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

#include <fcl/fcl.hpp>

#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/clean_command.hpp"
#include "commands/config_command.hpp"
#include "commands/duplicates_command.hpp"
#include "commands/history_command.hpp"
#include "commands/move_command.hpp"
#include "commands/rename_command.hpp"
#include "commands/report_command.hpp"
#include "commands/sort_command.hpp"
#include "commands/undo_command.hpp"

#include <iostream>
#include <memory>
#include <vector>

#include <unistd.h>

namespace {

using namespace fcl;
using namespace fcl::cli;

// Console plus the configured log file
std::shared_ptr<Logger> make_logger(const Config& config, bool verbose) {
    bool colors = config.use_colors && ::isatty(STDERR_FILENO);

    auto console = std::make_shared<ConsoleLogger>(colors);
    console->set_min_level(verbose ? LogLevel::DEBUG : LogLevel::WARNING);

    auto tee = std::make_shared<TeeLogger>();
    tee->set_min_level(LogLevel::DEBUG);
    tee->add(console);

    if (!config.log_file.empty()) {
        auto file = std::make_shared<FileLogger>(config.log_file);
        file->set_min_level(config.log_level);
        if (file->is_open()) {
            tee->add(file);
        } else {
            console->warning("Cannot open log file " + config.log_file.string());
        }
    }
    return tee;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"fcl - sort, rename, deduplicate and clean files, with undo"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string config_path = ConfigLoader::default_config_path().string();
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_option("--config", config_path, "Configuration file")
        ->type_name("PATH");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<SortCommand>());
    commands.push_back(std::make_unique<RenameCommand>());
    commands.push_back(std::make_unique<MoveCommand>());
    commands.push_back(std::make_unique<DuplicatesCommand>());
    commands.push_back(std::make_unique<CleanCommand>());
    commands.push_back(std::make_unique<ReportCommand>());
    commands.push_back(std::make_unique<HistoryCommand>());
    commands.push_back(std::make_unique<UndoCommand>());
    commands.push_back(std::make_unique<ConfigCommand>());

    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        registered.emplace_back(sub, command.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    Command* selected = nullptr;
    for (const auto& [sub, command] : registered) {
        if (sub->parsed()) {
            selected = command;
            break;
        }
    }
    if (selected == nullptr) {
        std::cerr << app.help();
        return FCL_EXIT_USER_ERROR;
    }

    auto config = ConfigLoader::load(config_path);
    if (!config.ok()) {
        return report_error(config.error());
    }

    CommandContext ctx;
    ctx.config = config.value();
    ctx.config_path = config_path;
    ctx.verbose = verbose;

    std::unique_ptr<FileManager> manager;
    if (selected->needs_manager()) {
        auto opened = FileManager::open(ctx.config, make_logger(ctx.config, verbose));
        if (!opened.ok()) {
            return report_error(opened.error());
        }
        manager = std::move(opened.value());
        ctx.manager = manager.get();
    }

    try {
        return selected->execute(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return FCL_EXIT_INTERNAL;
    }
}

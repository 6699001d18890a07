#pragma once

#include <fcl/file_manager.hpp>
#include <CLI/CLI.hpp>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "exit_codes.hpp"

namespace fcl::cli {

/**
 * Context passed to command execution.
 * Contains shared resources like the file manager.
 */
struct CommandContext {
    FileManager* manager = nullptr;   // Null for commands that do not need one
    Config config;
    std::filesystem::path config_path;
    bool verbose = false;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with the manager and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    /**
     * Get the command name (e.g., "sort", "undo").
     */
    virtual std::string name() const = 0;

    /**
     * Get a brief description for help text.
     */
    virtual std::string description() const = 0;

    /**
     * Whether execute() needs an opened FileManager.
     */
    virtual bool needs_manager() const { return true; }
};

// Helper functions used by multiple commands

/**
 * Print an error to stderr and map it to an exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error.code());
}

/**
 * Ask for confirmation on stdin.
 * Skipped (returns true) when confirmations are disabled in the config.
 */
inline bool confirm(const CommandContext& ctx, const std::string& prompt) {
    if (!ctx.config.confirm_actions) {
        return true;
    }
    std::cout << prompt << " [y/N] ";
    std::string response;
    std::getline(std::cin, response);
    return response == "y" || response == "Y";
}

/**
 * Write text to a file, or to stdout when path is empty.
 */
inline Result<void> write_output(const std::string& text, const std::filesystem::path& path) {
    if (path.empty()) {
        std::cout << text;
        if (!text.empty() && text.back() != '\n') {
            std::cout << "\n";
        }
        return Ok();
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string() + " for writing");
    }
    out << text;
    if (!out.good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to write " + path.string());
    }
    return Ok();
}

/**
 * Format a timestamp as local "YYYY-mm-dd HH:MM:SS".
 */
inline std::string format_time(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

inline void print_dry_run_notice(bool dry_run, const char* what) {
    if (dry_run) {
        std::cout << "\nDry run: no files were " << what << ".\n";
    }
}

}  // namespace fcl::cli

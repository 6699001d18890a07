#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Delete temporary or old files.
 */
class CleanCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "clean"; }
    std::string description() const override {
        return "Delete temporary or old files";
    }

private:
    std::string directory_;
    bool temp_ = false;
    int old_days_ = 0;
    CLI::Option* old_option_ = nullptr;
    bool no_recursive_ = false;
    bool dry_run_ = false;
    bool yes_ = false;
};

}  // namespace fcl::cli

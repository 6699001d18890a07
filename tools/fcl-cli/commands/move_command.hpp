#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Move files matching rules to destinations.
 */
class MoveCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "move"; }
    std::string description() const override {
        return "Move files matching rules to destinations";
    }

private:
    std::string directory_;
    std::vector<std::pair<std::string, std::string>> rules_;
    bool recursive_ = false;
    bool dry_run_ = false;
};

}  // namespace fcl::cli

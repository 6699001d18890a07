#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Reverse the most recent actions.
 */
class UndoCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "undo"; }
    std::string description() const override {
        return "Reverse the most recent actions";
    }

private:
    size_t count_ = 1;
    bool all_ = false;
    bool yes_ = false;
};

}  // namespace fcl::cli

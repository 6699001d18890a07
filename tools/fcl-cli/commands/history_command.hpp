#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Show recorded actions, newest first.
 */
class HistoryCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "history"; }
    std::string description() const override {
        return "Show recorded actions, newest first";
    }

private:
    size_t limit_ = 0;
};

}  // namespace fcl::cli

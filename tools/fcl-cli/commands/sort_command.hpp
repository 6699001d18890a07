#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Sort files into category folders.
 */
class SortCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "sort"; }
    std::string description() const override {
        return "Sort files into category folders";
    }

private:
    std::string directory_;
    std::string criteria_;
    bool recursive_ = false;
    bool dry_run_ = false;
};

}  // namespace fcl::cli

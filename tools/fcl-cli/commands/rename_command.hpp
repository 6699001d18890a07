#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Rename files by regular expression.
 */
class RenameCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "rename"; }
    std::string description() const override {
        return "Rename files by regular expression";
    }

private:
    std::string directory_;
    std::string pattern_;
    std::string replacement_;
    bool recursive_ = false;
    bool dry_run_ = false;
};

}  // namespace fcl::cli

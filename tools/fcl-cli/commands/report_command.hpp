#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Print statistics about a directory.
 */
class ReportCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "report"; }
    std::string description() const override {
        return "Print statistics about a directory";
    }

private:
    std::string directory_;
    std::string output_;
    bool json_ = false;
    bool bytes_ = false;
    bool no_recursive_ = false;
};

}  // namespace fcl::cli

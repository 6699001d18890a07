#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Find files with identical content.
 */
class DuplicatesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "duplicates"; }
    std::string description() const override {
        return "Find files with identical content";
    }

private:
    std::vector<std::string> directories_;
    std::string output_;
    bool json_ = false;
};

}  // namespace fcl::cli

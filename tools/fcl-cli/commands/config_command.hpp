#pragma once

#include "command.hpp"

namespace fcl::cli {

/**
 * Show or change configuration values.
 */
class ConfigCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Show or change configuration values";
    }

    bool needs_manager() const override { return false; }

private:
    CLI::App* get_ = nullptr;
    CLI::App* set_ = nullptr;
    CLI::App* list_ = nullptr;
    std::string key_;
    std::string value_;
};

}  // namespace fcl::cli

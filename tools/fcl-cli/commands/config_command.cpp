#include "config_command.hpp"

#include <fcl/config_loader.hpp>

namespace fcl::cli {

void ConfigCommand::setup(CLI::App& app) {
    get_ = app.add_subcommand("get", "Print one configuration value");
    get_->add_option("key", key_, "Configuration key")->required();

    set_ = app.add_subcommand("set", "Change one configuration value");
    set_->add_option("key", key_, "Configuration key")->required();
    set_->add_option("value", value_, "New value (JSON, or plain text)")->required();

    list_ = app.add_subcommand("list", "Print the whole configuration");

    app.require_subcommand(1);
}

int ConfigCommand::execute(CommandContext& ctx) {
    if (get_->parsed()) {
        auto value = ConfigLoader::get_value(ctx.config_path, key_);
        if (!value.ok()) {
            return report_error(value.error());
        }
        std::cout << key_ << " = " << value.value() << "\n";
        return FCL_EXIT_SUCCESS;
    }

    if (set_->parsed()) {
        auto updated = ConfigLoader::set_value(ctx.config_path, key_, value_);
        if (!updated.ok()) {
            return report_error(updated.error());
        }
        std::cout << "Updated " << key_ << " = " << value_ << "\n";
        return FCL_EXIT_SUCCESS;
    }

    if (list_->parsed()) {
        auto values = ConfigLoader::list_values(ctx.config_path);
        if (!values.ok()) {
            return report_error(values.error());
        }
        for (const auto& [key, value] : values.value()) {
            std::cout << key << " = " << value << "\n";
        }
        return FCL_EXIT_SUCCESS;
    }

    std::cerr << "Error: expected get, set or list\n";
    return FCL_EXIT_USER_ERROR;
}

}  // namespace fcl::cli

#include "duplicates_command.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

namespace fcl::cli {

void DuplicatesCommand::setup(CLI::App& app) {
    app.add_option("directories", directories_, "Directories to scan")
        ->required()
        ->type_name("<dir>...");

    app.add_option("-o,--output", output_, "Write results to a file instead of stdout");
    app.add_flag("--json", json_, "Output as JSON");
}

int DuplicatesCommand::execute(CommandContext& ctx) {
    std::vector<std::filesystem::path> roots(directories_.begin(), directories_.end());

    auto result = ctx.manager->find_duplicates(roots);
    if (!result.ok()) {
        return report_error(result.error());
    }
    const auto& groups = result.value();

    std::string text;
    if (json_) {
        nlohmann::ordered_json out = nlohmann::ordered_json::object();
        for (const auto& [fingerprint, files] : groups) {
            auto& paths = out[fingerprint] = nlohmann::ordered_json::array();
            for (const auto& file : files) {
                paths.push_back(file.string());
            }
        }
        text = out.dump(4);
    } else if (groups.empty()) {
        text = "No duplicates found.\n";
    } else {
        std::ostringstream ss;
        ss << "Found " << groups.size() << " group(s) of duplicates:\n";
        for (const auto& [fingerprint, files] : groups) {
            ss << "\n" << fingerprint.substr(0, 12) << " (" << files.size() << " files)\n";
            for (const auto& file : files) {
                ss << "  - " << file.string() << "\n";
            }
        }
        text = ss.str();
    }

    auto written = write_output(text, output_);
    if (!written.ok()) {
        return report_error(written.error());
    }
    if (!output_.empty()) {
        std::cout << "Results written to " << output_ << "\n";
    }
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

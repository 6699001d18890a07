#include "report_command.hpp"

namespace fcl::cli {

void ReportCommand::setup(CLI::App& app) {
    app.add_option("directory", directory_, "Directory to analyze")
        ->required()
        ->type_name("<dir>");

    app.add_option("-o,--output", output_, "Write the report to a file instead of stdout");
    app.add_flag("--json", json_, "Output as JSON");
    app.add_flag("--bytes", bytes_, "Show sizes as raw byte counts");
    app.add_flag("--no-recursive", no_recursive_, "Only the top-level directory");
}

int ReportCommand::execute(CommandContext& ctx) {
    ReportFormat format = json_ ? ReportFormat::JSON : ReportFormat::TEXT;

    auto report = ctx.manager->generate_report(directory_, !no_recursive_, format, !bytes_);
    if (!report.ok()) {
        return report_error(report.error());
    }

    auto written = write_output(report.value(), output_);
    if (!written.ok()) {
        return report_error(written.error());
    }
    if (!output_.empty()) {
        std::cout << "Report written to " << output_ << "\n";
    }
    return FCL_EXIT_SUCCESS;
}

}  // namespace fcl::cli

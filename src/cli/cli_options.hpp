#pragma once
#include <CLI/CLI.hpp>
#include <string>

#include "../timesheet/work_days.hpp"

struct AppOptions {
    // Range; empty means "use the default"
    std::string start;          // YYYY-MM-DD, default: Monday on or before end
    std::string end;            // YYYY-MM-DD, default: today

    // Rows
    int         hours = 8;
    std::string job   = "Work Time";

    // Output
    std::string output_dir = ".";

    tsgen::timesheet_config timesheet() const {
        return tsgen::timesheet_config{ hours, job };
    }
};

// Registers every option on `app`; values land in `opt` once app.parse() runs.
// Date strings are not validated here, resolve_range() reports them.
inline void configure_cli(CLI::App& app, AppOptions& opt) {
    app.name("tsgen");
    app.description("Generate a CSV timesheet with one row per weekday");
    app.set_version_flag("--version", "0.1.0");
    app.set_config("--config", "", "Read options from a TOML/INI file");

    // Range
    app.add_option("--start", opt.start,
                   "Start date in YYYY-MM-DD format, defaults to last Monday");
    app.add_option("--end",   opt.end,
                   "End date in YYYY-MM-DD format, defaults to today");

    // Rows
    app.add_option("--hours", opt.hours, "Number of hours per day")->default_val(8);
    app.add_option("--job",   opt.job,   "Job name")->default_val("Work Time");

    // Output
    app.add_option("-o,--output-dir", opt.output_dir,
                   "Directory the CSV file is written to")->default_val(".");
}

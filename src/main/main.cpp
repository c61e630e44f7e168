#include <fmt/format.h>
#include <exception>

#include "../cli/cli_options.hpp"
#include "../types/civil_date.hpp"
#include "run_timesheet.hpp"

int main(int argc, char** argv) try {
    AppOptions opt;
    CLI::App app;
    configure_cli(app, opt);
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);   // prints usage/errors; 0 for --help and --version
    }

    return run_and_report(opt, tsgen::today_local());
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return exit_internal;
}

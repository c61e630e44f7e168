#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>

#include "../cli/cli_options.hpp"
#include "../csv/row_writer.hpp"
#include "../io/output_file.hpp"
#include "../timesheet/date_range.hpp"
#include "../timesheet/errors.hpp"
#include "../timesheet/work_days.hpp"
#include "../types/civil_date.hpp"
#include "../types/parse_date.hpp"

// Exit codes of the tsgen executable (CLI11 parse errors use CLI11's own).
enum exit_code : int {
    exit_ok           = 0,
    exit_bad_date     = 1,
    exit_io           = 2,
    exit_bad_range    = 3,
    exit_internal     = 4,
};

/**
 * Resolves the range, then writes <output_dir>/<start>.<end>.csv.
 * Returns the number of rows written. Status lines go to stderr.
 *
 * The range is resolved and validated before the output directory or file
 * is touched, so format_error and range_error never leave a file behind.
 */
inline std::size_t run_timesheet(const AppOptions& opt, const tsgen::civil_date& today) {
    namespace fs = std::filesystem;

    const tsgen::date_range range = tsgen::resolve_range(opt.start, opt.end, today);

    fmt::print(stderr, "Start: {}\n", tsgen::format_flag_date(range.start));
    fmt::print(stderr, "End:   {}\n", tsgen::format_flag_date(range.end));

    if (opt.job.find_first_of("\r\n") != std::string::npos) {
        fmt::print(stderr, "WARN: job name contains a line break, it will be quoted in the CSV\n");
    }

    const tsgen::work_day_sequence days(range, opt.timesheet());

    // --- output file
    const fs::path out_dir  = opt.output_dir;
    const fs::path out_path = out_dir / tsgen::timesheet_filename(range);
    tsgen::ensure_output_dir(out_dir);

    std::ofstream out = tsgen::open_timesheet(out_path);
    const std::size_t written = tsgen::write_timesheet_csv(out, days);
    tsgen::close_timesheet(out, out_path);

    fmt::print(stderr, "Wrote {} days to {}\n", written, out_path.string());
    return written;
}

// run_timesheet() with every failure printed as "ERROR: ..." and mapped to an exit code.
inline int run_and_report(const AppOptions& opt, const tsgen::civil_date& today) {
    try {
        run_timesheet(opt, today);
        return exit_ok;
    }
    catch (const tsgen::format_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_bad_date;
    }
    catch (const tsgen::io_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_io;
    }
    catch (const tsgen::range_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_bad_range;
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_internal;
    }
}

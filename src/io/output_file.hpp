#pragma once
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "../timesheet/date_range.hpp"
#include "../timesheet/errors.hpp"
#include "../types/parse_date.hpp"

namespace tsgen {

// <start>.<end>.csv, both dates as YYYY-MM-DD.
inline std::string timesheet_filename(const date_range& r) {
    return format_flag_date(r.start) + "." + format_flag_date(r.end) + ".csv";
}

inline void ensure_output_dir(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    if (dir.empty()) return;
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return;
    fs::create_directories(dir, ec);
    if (ec) {
        throw io_error(fmt::format("could not create output directory \"{}\": {}", dir.string(), ec.message()));
    }
}

inline std::ofstream open_timesheet(const std::filesystem::path& p) {
    errno = 0;
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
        const std::string reason = errno ? std::strerror(errno) : "open failed";
        throw io_error(fmt::format("could not create file \"{}\": {}", p.string(), reason));
    }
    return out;
}

inline void close_timesheet(std::ofstream& out, const std::filesystem::path& p) {
    out.close();
    if (out.fail()) {
        throw io_error(fmt::format("could not close file \"{}\"", p.string()));
    }
}

}

#pragma once
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>

#include "../timesheet/errors.hpp"
#include "../timesheet/work_days.hpp"
#include "../util/csv_escape.hpp"

namespace tsgen {

inline constexpr std::string_view timesheet_header[] = {
    "Date", "Job Name", "From time", "To time", "Hours"
};

// One comma-separated line, '\n' terminated.
template <typename Fields>
inline void write_csv_row(std::ostream& out, const Fields& fields, char delimiter = ',') {
    bool first = true;
    for (const auto& f : fields) {
        if (!first) out << delimiter;
        out << csv_escape(f, delimiter);
        first = false;
    }
    out << '\n';
}

inline void write_csv_row(std::ostream& out, std::initializer_list<std::string_view> fields,
                          char delimiter = ',') {
    write_csv_row<std::initializer_list<std::string_view>>(out, fields, delimiter);
}

/**
 * Writes the header and one row per work day to `out`.
 * Returns the number of data rows written.
 * Throws io_error as soon as the stream reports a failure.
 */
inline std::size_t write_timesheet_csv(std::ostream& out, const work_day_sequence& days) {
    write_csv_row(out, timesheet_header);
    if (!out) throw io_error("could not write header");

    std::size_t rows = 0;
    for (const work_day_record& rec : days) {
        const std::string hours = std::to_string(rec.hours);
        write_csv_row(out, { rec.date, rec.job_name, rec.start_time, rec.end_time, hours });
        if (!out) throw io_error("could not write records");
        ++rows;
    }

    out.flush();
    if (!out) throw io_error("could not write records");
    return rows;
}

}

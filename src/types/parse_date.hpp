#pragma once
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <optional>

#include "civil_date.hpp"

namespace tsgen {

// Human-readable form of the format accepted on the command line.
inline constexpr const char* flag_date_layout = "YYYY-MM-DD";

// Strict YYYY-MM-DD. std::get_time alone accepts one-digit fields and
// trailing garbage, so the shape is checked first.
inline std::optional<civil_date> parse_flag_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }

    std::tm tm{};
    std::istringstream iss(std::string{s});
    iss >> std::get_time(&tm, "%Y-%m-%d");
    if (iss.fail()) return std::nullopt;

    const civil_date d{ tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday };
    if (!is_valid(d)) return std::nullopt;
    return d;
}

inline std::string format_flag_date(const civil_date& d) {
    return fmt::format("{:04}-{:02}-{:02}", d.year, d.month, d.day);
}

// DD-Mon-YYYY, e.g. 02-Jan-2006. Month names are fixed English abbreviations.
inline std::string format_csv_date(const civil_date& d) {
    static constexpr const char* months[] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
    };
    const char* mon = (d.month >= 1 && d.month <= 12) ? months[d.month - 1] : "???";
    return fmt::format("{:02}-{}-{:04}", d.day, mon, d.year);
}

// hh:mm am/pm for a whole hour. Hours outside [0, 24) wrap around the clock.
inline std::string format_clock_12h(long long hour) {
    const int h = static_cast<int>(((hour % 24) + 24) % 24);
    const int h12 = (h % 12 == 0) ? 12 : h % 12;
    return fmt::format("{:02}:00 {}", h12, h < 12 ? "am" : "pm");
}

}

#pragma once
#include <fmt/format.h>
#include <string>
#include <string_view>

#include "../types/civil_date.hpp"
#include "../types/parse_date.hpp"
#include "errors.hpp"

namespace tsgen {

struct date_range {
    civil_date start;
    civil_date end;     // inclusive
};

namespace detail {

inline civil_date parse_date_flag(std::string_view flag, std::string_view text) {
    auto d = parse_flag_date(text);
    if (!d) {
        throw format_error(std::string(flag),
            fmt::format("invalid {} \"{}\", expected format \"{}\"", flag, text, flag_date_layout));
    }
    return *d;
}

}

// The Monday on or before d.
inline civil_date monday_on_or_before(const civil_date& d) noexcept {
    const long z = days_from_civil(d);
    const int dow = static_cast<int>(weekday_from_days(z));   // Sunday = 0
    return civil_from_days(z - (dow + 6) % 7);
}

/**
 * Resolves the effective range from the --start/--end flag values.
 * An empty string means the flag was not given.
 *
 *   end   defaults to `today`
 *   start defaults to the Monday on or before the resolved end
 *
 * Throws format_error for a malformed flag (--end is checked first) and
 * range_error when start > end.
 */
inline date_range resolve_range(std::string_view start_text,
                                std::string_view end_text,
                                const civil_date& today) {
    const civil_date end = end_text.empty()
        ? today
        : detail::parse_date_flag("--end", end_text);

    const civil_date start = start_text.empty()
        ? monday_on_or_before(end)
        : detail::parse_date_flag("--start", start_text);

    if (end < start) {
        throw range_error(fmt::format("start day {} is after end day {}",
                                      format_flag_date(start), format_flag_date(end)));
    }
    return date_range{ start, end };
}

}

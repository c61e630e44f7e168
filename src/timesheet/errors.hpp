#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace tsgen {

struct timesheet_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// An explicit date flag does not match YYYY-MM-DD.
class format_error : public timesheet_error {
public:
    format_error(std::string flag, const std::string& what)
        : timesheet_error(what), flag_(std::move(flag)) {}

    const std::string& flag() const noexcept { return flag_; }

private:
    std::string flag_;
};

// Resolved start date lies after the resolved end date.
struct range_error : timesheet_error {
    using timesheet_error::timesheet_error;
};

// Output directory or file could not be created, written or closed.
struct io_error : timesheet_error {
    using timesheet_error::timesheet_error;
};

}

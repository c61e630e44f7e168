#pragma once
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "../types/civil_date.hpp"
#include "../types/parse_date.hpp"
#include "date_range.hpp"

namespace tsgen {

// Every row starts at 8:00 am.
inline constexpr int base_hour = 8;

struct timesheet_config {
    int         hours    = 8;
    std::string job_name = "Work Time";
};

struct work_day_record {
    std::string date;         // DD-Mon-YYYY
    std::string job_name;
    std::string start_time;   // hh:mm am/pm
    std::string end_time;
    int         hours = 0;
};

// Weekdays of a date_range as work_day_records, computed on demand.
// Each begin() walks the range again from the start.
class work_day_sequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = work_day_record;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const work_day_record*;
        using reference         = work_day_record;

        iterator() = default;

        work_day_record operator*() const { return seq_->make_record(day_); }

        iterator& operator++() {
            ++day_;
            skip_weekend();
            return *this;
        }
        iterator operator++(int) { iterator tmp = *this; ++*this; return tmp; }

        bool operator==(const iterator& o) const noexcept { return day_ == o.day_; }
        bool operator!=(const iterator& o) const noexcept { return day_ != o.day_; }

    private:
        friend class work_day_sequence;

        iterator(const work_day_sequence* seq, long day) : seq_(seq), day_(day) { skip_weekend(); }

        void skip_weekend() noexcept {
            while (day_ <= seq_->last_ && is_weekend(weekday_from_days(day_))) ++day_;
        }

        const work_day_sequence* seq_ = nullptr;
        long day_ = 0;   // days since 1970-01-01; last_ + 1 is the end position
    };

    work_day_sequence(const date_range& range, timesheet_config cfg)
        : first_(days_from_civil(range.start)),
          last_(days_from_civil(range.end)),
          cfg_(std::move(cfg)),
          start_time_(format_clock_12h(base_hour)),
          end_time_(format_clock_12h(static_cast<long long>(base_hour) + cfg_.hours))
    {
        // an inverted range yields nothing rather than walking forever
        if (last_ < first_) last_ = first_ - 1;
    }

    iterator begin() const { return iterator(this, first_); }
    iterator end() const   { return iterator(this, last_ + 1); }

    std::size_t size() const {
        return static_cast<std::size_t>(std::distance(begin(), end()));
    }
    bool empty() const { return begin() == end(); }

    std::vector<work_day_record> to_vector() const {
        std::vector<work_day_record> out;
        for (auto&& rec : *this) out.push_back(rec);
        return out;
    }

    const timesheet_config& config() const noexcept { return cfg_; }

private:
    work_day_record make_record(long day) const {
        return work_day_record{
            format_csv_date(civil_from_days(day)),
            cfg_.job_name,
            start_time_,
            end_time_,
            cfg_.hours
        };
    }

    long first_;
    long last_;
    timesheet_config cfg_;
    std::string start_time_;
    std::string end_time_;
};

}

#include <gtest/gtest.h>
#include <string>
#include "timesheet/date_range.hpp"

using namespace tsgen;

namespace {
const civil_date kWednesday{2024, 1, 10};
}

TEST(ResolveRange, ExplicitDates)
{
        const auto r = resolve_range("2024-01-01", "2024-01-07", kWednesday);
        EXPECT_EQ(r.start, (civil_date{2024, 1, 1}));
        EXPECT_EQ(r.end, (civil_date{2024, 1, 7}));
}

TEST(ResolveRange, EndDefaultsToToday)
{
        const auto r = resolve_range("2024-01-02", "", kWednesday);
        EXPECT_EQ(r.end, kWednesday);
        EXPECT_EQ(r.start, (civil_date{2024, 1, 2}));
}

TEST(ResolveRange, StartDefaultsToMondayOfEndWeek)
{
        const auto r = resolve_range("", "2024-01-10", kWednesday);
        EXPECT_EQ(r.start, (civil_date{2024, 1, 8}));
        EXPECT_EQ(r.end, (civil_date{2024, 1, 10}));
}

TEST(ResolveRange, StartDefaultsToEndWhenEndIsMonday)
{
        const auto r = resolve_range("", "2024-01-08", kWednesday);
        EXPECT_EQ(r.start, r.end);
        EXPECT_EQ(r.start, (civil_date{2024, 1, 8}));
}

TEST(ResolveRange, SundayEndGoesBackSixDays)
{
        const auto r = resolve_range("", "2024-01-07", kWednesday);
        EXPECT_EQ(r.start, (civil_date{2024, 1, 1}));
}

TEST(ResolveRange, BothDefaultsUseToday)
{
        const auto r = resolve_range("", "", civil_date{2024, 3, 1});   // Friday
        EXPECT_EQ(r.start, (civil_date{2024, 2, 26}));
        EXPECT_EQ(r.end, (civil_date{2024, 3, 1}));
}

TEST(ResolveRange, DefaultMondayCrossesYearBoundary)
{
        const auto r = resolve_range("", "2025-01-01", kWednesday);
        EXPECT_EQ(r.start, (civil_date{2024, 12, 30}));
}

TEST(ResolveRange, StartAfterEndIsRangeError)
{
        try {
                resolve_range("2024-03-10", "2024-03-01", kWednesday);
                FAIL() << "expected range_error";
        } catch (const range_error& e) {
                const std::string msg = e.what();
                EXPECT_NE(msg.find("2024-03-10"), std::string::npos);
                EXPECT_NE(msg.find("2024-03-01"), std::string::npos);
        }
}

TEST(ResolveRange, StartAfterDefaultEndIsRangeError)
{
        EXPECT_THROW(resolve_range("2024-01-11", "", kWednesday), range_error);
}

TEST(ResolveRange, SameDayIsAccepted)
{
        const auto r = resolve_range("2024-01-07", "2024-01-07", kWednesday);
        EXPECT_EQ(r.start, r.end);
}

TEST(ResolveRange, BadStartIsFormatErrorNamingFlag)
{
        try {
                resolve_range("03/10/2024", "2024-03-20", kWednesday);
                FAIL() << "expected format_error";
        } catch (const format_error& e) {
                EXPECT_EQ(e.flag(), "--start");
                const std::string msg = e.what();
                EXPECT_NE(msg.find("--start"), std::string::npos);
                EXPECT_NE(msg.find("03/10/2024"), std::string::npos);
                EXPECT_NE(msg.find("YYYY-MM-DD"), std::string::npos);
        }
}

TEST(ResolveRange, BadEndIsFormatErrorNamingFlag)
{
        try {
                resolve_range("", "2024-3-1", kWednesday);
                FAIL() << "expected format_error";
        } catch (const format_error& e) {
                EXPECT_EQ(e.flag(), "--end");
        }
}

TEST(ResolveRange, EndIsCheckedBeforeStart)
{
        try {
                resolve_range("bad", "also bad", kWednesday);
                FAIL() << "expected format_error";
        } catch (const format_error& e) {
                EXPECT_EQ(e.flag(), "--end");
        }
}

TEST(MondayOnOrBefore, EveryDayOfAWeek)
{
        const civil_date monday{2024, 1, 8};
        for (int i = 0; i < 7; ++i) {
                EXPECT_EQ(monday_on_or_before(add_days(monday, i)), monday) << "offset " << i;
        }
        EXPECT_EQ(monday_on_or_before(add_days(monday, 7)), add_days(monday, 7));
        EXPECT_EQ(monday_on_or_before(add_days(monday, -1)), add_days(monday, -7));
}

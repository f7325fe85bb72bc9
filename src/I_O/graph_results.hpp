#pragma once
// I_O/graph_results.hpp

#include <string>
#include <vector>

// Calendar date (no time of day)
struct CalendarDate {
    int year;
    int month;
    int day;

    bool operator<(const CalendarDate& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator==(const CalendarDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }

    // "YYYY-MM-DD"
    std::string toString() const;
};

// Days in @p month (1-12) of @p year, Gregorian leap years included.
int daysInMonth(int year, int month);

// ───────── parseTimestamp ─────────
// Parses "YYYY-MM-DD HH:MM" and keeps the calendar date.
// Throws std::invalid_argument on malformed input or a day past the end of
// its month.
CalendarDate parseTimestamp(const std::string& timestamp);

// ───────── distinctDates ─────────
// Calendar dates of @p timestamps, deduplicated and sorted ascending.
std::vector<CalendarDate> distinctDates(const std::vector<std::string>& timestamps);

// ───────── graphETResults ─────────
// Groups (timestamp, value) pairs by calendar date and, when @p verbose is
// set, renders the per-date mean as a text bar chart on standard output.
//
// @param date_time          Timestamps "YYYY-MM-DD HH:MM"
// @param evapotranspiration Values paired with @p date_time
// @param verbose            Render the chart
// @param title, ylabel, xlabel  Chart labels
// @returns                  Distinct dates in ascending order
// Throws std::invalid_argument if the two sequences differ in length.
std::vector<CalendarDate> graphETResults(const std::vector<std::string>& date_time,
                                         const std::vector<double>& evapotranspiration,
                                         bool verbose = false,
                                         const std::string& title = "Evapotranspiration",
                                         const std::string& ylabel = "mm",
                                         const std::string& xlabel = "Date");

// I_O/graph_results.cpp

#include "graph_results.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

std::string CalendarDate::toString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return std::string(buf);
}

int daysInMonth(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        throw std::invalid_argument("Month " + std::to_string(month) + " is out of range");
    }
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : days[month - 1];
}

CalendarDate parseTimestamp(const std::string& timestamp) {
    std::tm tm = {};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M");
    if (ss.fail()) {
        throw std::invalid_argument("Timestamp '" + timestamp + "' does not match YYYY-MM-DD HH:MM");
    }
    ss >> std::ws;
    if (!ss.eof()) {
        throw std::invalid_argument("Trailing characters in timestamp '" + timestamp + "'");
    }
    CalendarDate date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    if (date.day > daysInMonth(date.year, date.month)) {
        throw std::invalid_argument("Day is out of range for month in timestamp '" + timestamp + "'");
    }
    return date;
}

std::vector<CalendarDate> distinctDates(const std::vector<std::string>& timestamps) {
    std::vector<CalendarDate> dates;
    dates.reserve(timestamps.size());
    for (const auto& ts : timestamps) {
        dates.push_back(parseTimestamp(ts));
    }
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return dates;
}

std::vector<CalendarDate> graphETResults(const std::vector<std::string>& date_time,
                                         const std::vector<double>& evapotranspiration,
                                         bool verbose,
                                         const std::string& title,
                                         const std::string& ylabel,
                                         const std::string& xlabel) {
    if (date_time.size() != evapotranspiration.size()) {
        throw std::invalid_argument("graphETResults: " + std::to_string(date_time.size())
                                    + " timestamps for " + std::to_string(evapotranspiration.size())
                                    + " values");
    }

    std::vector<CalendarDate> dates = distinctDates(date_time);
    if (!verbose) {
        return dates;
    }

    // Daily mean over the finite values of each date
    std::map<CalendarDate, std::pair<double, int>> daily;
    for (size_t i = 0; i < date_time.size(); ++i) {
        auto& acc = daily[parseTimestamp(date_time[i])];
        if (std::isfinite(evapotranspiration[i])) {
            acc.first += evapotranspiration[i];
            acc.second += 1;
        }
    }

    double vmax = 0.0;
    for (const auto& d : daily) {
        if (d.second.second > 0) {
            vmax = std::max(vmax, std::fabs(d.second.first / d.second.second));
        }
    }

    constexpr int BAR_WIDTH = 50;
    std::ios_base::fmtflags flags = std::cout.flags();
    std::streamsize precision = std::cout.precision();
    std::cout << "───────── " << title << " ─────────\n";
    std::cout << std::left << std::setw(12) << xlabel << ylabel << "\n";
    for (const auto& date : dates) {
        const auto& acc = daily[date];
        std::cout << std::left << std::setw(12) << date.toString();
        if (acc.second == 0) {
            std::cout << std::right << std::setw(10) << "nan" << " |\n";
            continue;
        }
        double mean = acc.first / acc.second;
        int len = vmax > 0.0 ? int(std::lround(BAR_WIDTH * std::fabs(mean) / vmax)) : 0;
        std::cout << std::right << std::setw(10) << std::fixed << std::setprecision(3) << mean
                  << " |" << std::string(len, mean < 0.0 ? '-' : '#') << "\n";
    }
    std::cout.flags(flags);
    std::cout.precision(precision);
    std::cout << std::flush;

    return dates;
}

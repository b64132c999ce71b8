#include "util/TimeCodec.h"

#include <cctype>
#include <climits>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace TimeCodec {

namespace {

bool ParseInt(const std::string& text, size_t start, size_t len, int* out) {
    if (len == 0 || start + len > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < len; ++i) {
        char c = text[start + i];
        if (c < '0' || c > '9') {
            return false;
        }
        if (value > (INT_MAX - 9) / 10) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    *out = value;
    return true;
}

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

const std::string& FirstNonEmpty(const std::string& a, const std::string& b, const std::string& c) {
    if (!a.empty()) {
        return a;
    }
    if (!b.empty()) {
        return b;
    }
    return c;
}

// Splits hours into whole hours and rounded minutes, carrying 60 into the hour.
void SplitHoursMinutes(double decimal_hours, int* hours, int* minutes) {
    int h = static_cast<int>(std::floor(decimal_hours));
    int m = static_cast<int>(std::lround((decimal_hours - h) * 60.0));
    if (m >= 60) {
        h += 1;
        m -= 60;
    }
    *hours = h;
    *minutes = m;
}

} // namespace

double Parse(const std::string& time_str) {
    std::string text = Trim(time_str);
    if (text.empty()) {
        return kDefaultHour;
    }
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return kDefaultHour;
    }
    size_t minute_end = text.find(':', colon + 1);
    if (minute_end == std::string::npos) {
        minute_end = text.size();
    }

    int hour = 0;
    int minute = 0;
    if (!ParseInt(text, 0, colon, &hour) ||
        !ParseInt(text, colon + 1, minute_end - colon - 1, &minute)) {
        return kDefaultHour;
    }
    return hour + minute / 60.0;
}

double StartHour(const YearSeries& year, TimeMode mode, int mass_offset_min) {
    switch (mode) {
        case TimeMode::EliteMen:
            return Parse(FirstNonEmpty(year.start_time_elite_men, year.start_time_elite, year.start_time_mass));
        case TimeMode::EliteWomen:
            return Parse(FirstNonEmpty(year.start_time_elite_women, year.start_time_elite, year.start_time_mass));
        case TimeMode::Mass:
        default:
            // Wave starts are modelled as a minute offset from the first mass start.
            return Parse(year.start_time_mass) + mass_offset_min / 60.0;
    }
}

std::string Format(double decimal_hours) {
    int hours = 0;
    int minutes = 0;
    SplitHoursMinutes(decimal_hours, &hours, &minutes);
    hours = ((hours % 24) + 24) % 24;

    const char* suffix = hours >= 12 ? "pm" : "am";
    int hour12 = hours % 12;
    if (hour12 == 0) {
        hour12 = 12;
    }

    std::ostringstream oss;
    oss << hour12 << ":" << std::setfill('0') << std::setw(2) << minutes << suffix;
    return oss.str();
}

std::string FormatDuration(double hours) {
    int h = 0;
    int m = 0;
    SplitHoursMinutes(hours, &h, &m);
    std::ostringstream oss;
    oss << h << ":" << std::setfill('0') << std::setw(2) << m;
    return oss.str();
}

std::string FormatHourTick(int hour) {
    int hours = ((hour % 24) + 24) % 24;
    int hour12 = hours % 12;
    if (hour12 == 0) {
        hour12 = 12;
    }
    return std::to_string(hour12) + (hours >= 12 ? "pm" : "am");
}

int MonthOfDate(const std::string& date_iso) {
    int year = 0;
    int month = 0;
    if (date_iso.size() < 7 ||
        !ParseInt(date_iso, 0, 4, &year) || date_iso[4] != '-' ||
        !ParseInt(date_iso, 5, 2, &month)) {
        return 0;
    }
    if (month < 1 || month > 12) {
        return 0;
    }
    return month;
}

bool TimeModeFromName(const std::string& name, TimeMode* out) {
    if (name == "mass") {
        *out = TimeMode::Mass;
    } else if (name == "eliteMen") {
        *out = TimeMode::EliteMen;
    } else if (name == "eliteWomen") {
        *out = TimeMode::EliteWomen;
    } else {
        return false;
    }
    return true;
}

const char* TimeModeName(TimeMode mode) {
    switch (mode) {
        case TimeMode::EliteMen: return "eliteMen";
        case TimeMode::EliteWomen: return "eliteWomen";
        case TimeMode::Mass: return "mass";
    }
    return "mass";
}

} // namespace TimeCodec

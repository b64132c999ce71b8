#pragma once

#include "model/RaceData.h"

#include <string>

namespace TimeCodec {

// Used when a clock-time string is empty or malformed.
constexpr double kDefaultHour = 9.0;

double Parse(const std::string& time_str); // "HH:MM[:SS]" -> decimal hours
double StartHour(const YearSeries& year, TimeMode mode, int mass_offset_min);
std::string Format(double decimal_hours);         // 9.5 -> "9:30am"
std::string FormatDuration(double hours);         // 3.5 -> "3:30"
std::string FormatHourTick(int hour);             // 13 -> "1pm"
int MonthOfDate(const std::string& date_iso);     // 1-12, 0 if unparsable

bool TimeModeFromName(const std::string& name, TimeMode* out);
const char* TimeModeName(TimeMode mode);
}

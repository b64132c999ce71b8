#pragma once

#include "model/RaceData.h"

#include <string>
#include <vector>

// Temperature and dew point of one moment, each in the display unit.
struct ReadingPair {
    double temp = 0.0;
    double dew = 0.0;
};

struct YearReadings {
    int year = 0;
    std::string race_date;
    double start_hour = 0.0;
    double finish_hour = 0.0;
    ReadingPair start;
    ReadingPair finish;
};

namespace YearDetail {

// Interpolated readings at the year's own start and at start + duration.
// Temperature and dew point are converted separately (32F origin each).
YearReadings Compute(const YearSeries& year, const ChartSettings& settings);

// "2023 (2023-04-23)  Start 9:00am 55.0/47.0F  Finish 12:00pm 61.2/49.0F"
std::string Describe(const YearReadings& readings, Unit unit);

// Every distinct year across the races, newest first.
std::vector<int> AllYears(const std::vector<RaceDataset>& races);

// Next entry after `current` in `years`, cycling through 0 (no selection).
int StepSelection(const std::vector<int>& years, int current, int direction);
}

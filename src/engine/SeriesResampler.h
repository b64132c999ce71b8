#pragma once

#include "model/RaceData.h"

#include <vector>

// Raw Fahrenheit pair; metric/unit derivation is a separate step.
struct RawReading {
    double temp = 0.0;
    double dew = 0.0;
};

struct HourlyPoint {
    double hour = 0.0;
    double temp = 0.0;
    double dew = 0.0;
};

namespace SeriesResampler {

// Returned when a series has no samples at all. Reads as a zero temperature
// rather than "no data"; callers that care must check for empty samples.
constexpr RawReading kEmptySeriesReading{ 0.0, 0.0 };

// Copies of the samples projected to decimal hours, stably sorted ascending.
std::vector<HourlyPoint> SortedPoints(const std::vector<WeatherSample>& samples);

// Linear interpolation between the bracketing samples, clamped to the first
// and last sample outside the covered range.
RawReading ValueAt(const std::vector<HourlyPoint>& sorted, double target_hour);
RawReading ValueAt(const YearSeries& series, double target_hour);
}

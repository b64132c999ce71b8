#include "engine/YearDetail.h"

#include "engine/MetricDeriver.h"
#include "engine/SeriesResampler.h"
#include "util/TimeCodec.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace YearDetail {

namespace {

ReadingPair ToDisplay(const RawReading& raw, Unit unit) {
    return {
        MetricDeriver::Derive(raw.temp, 0.0, Metric::Temp, unit),
        MetricDeriver::Derive(raw.dew, 0.0, Metric::Temp, unit)
    };
}

std::string FormatPair(const ReadingPair& pair, Unit unit) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << pair.temp << "/" << pair.dew << MetricDeriver::UnitSymbol(unit);
    return oss.str();
}

} // namespace

YearReadings Compute(const YearSeries& year, const ChartSettings& settings) {
    YearReadings readings;
    readings.year = year.year;
    readings.race_date = year.race_date;
    readings.start_hour = TimeCodec::StartHour(year, settings.time_mode, settings.mass_offset_min);
    readings.finish_hour = readings.start_hour + settings.duration_hours;

    std::vector<HourlyPoint> sorted = SeriesResampler::SortedPoints(year.samples);
    readings.start = ToDisplay(SeriesResampler::ValueAt(sorted, readings.start_hour), settings.unit);
    readings.finish = ToDisplay(SeriesResampler::ValueAt(sorted, readings.finish_hour), settings.unit);
    return readings;
}

std::string Describe(const YearReadings& readings, Unit unit) {
    std::string text = std::to_string(readings.year);
    if (!readings.race_date.empty()) {
        text += " (" + readings.race_date + ")";
    }
    text += "  Start " + TimeCodec::Format(readings.start_hour) + " " + FormatPair(readings.start, unit);
    text += "  Finish " + TimeCodec::Format(readings.finish_hour) + " " + FormatPair(readings.finish, unit);
    return text;
}

std::vector<int> AllYears(const std::vector<RaceDataset>& races) {
    std::vector<int> years;
    for (const auto& race : races) {
        for (const auto& year : race.history) {
            years.push_back(year.year);
        }
    }
    std::sort(years.begin(), years.end(), [](int a, int b) { return a > b; });
    years.erase(std::unique(years.begin(), years.end()), years.end());
    return years;
}

int StepSelection(const std::vector<int>& years, int current, int direction) {
    if (years.empty()) {
        return 0;
    }
    // Position 0 is "no selection", positions 1..n are the years.
    int count = static_cast<int>(years.size()) + 1;
    int pos = 0;
    auto it = std::find(years.begin(), years.end(), current);
    if (it != years.end()) {
        pos = static_cast<int>(it - years.begin()) + 1;
    }
    pos = ((pos + (direction >= 0 ? 1 : -1)) % count + count) % count;
    return pos == 0 ? 0 : years[pos - 1];
}

} // namespace YearDetail

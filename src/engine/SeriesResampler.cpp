#include "engine/SeriesResampler.h"

#include "util/TimeCodec.h"

#include <algorithm>

namespace SeriesResampler {

namespace {

double Lerp(double before, double after, double fraction) {
    return before + fraction * (after - before);
}

} // namespace

std::vector<HourlyPoint> SortedPoints(const std::vector<WeatherSample>& samples) {
    std::vector<HourlyPoint> points;
    points.reserve(samples.size());
    for (const auto& sample : samples) {
        points.push_back({ TimeCodec::Parse(sample.clock_time), sample.temperature_f, sample.dew_point_f });
    }
    std::stable_sort(points.begin(), points.end(), [](const HourlyPoint& a, const HourlyPoint& b) {
        return a.hour < b.hour;
    });
    return points;
}

RawReading ValueAt(const std::vector<HourlyPoint>& sorted, double target_hour) {
    if (sorted.empty()) {
        return kEmptySeriesReading;
    }

    auto after = std::find_if(sorted.begin(), sorted.end(), [target_hour](const HourlyPoint& p) {
        return p.hour >= target_hour;
    });

    if (after == sorted.end()) {
        const HourlyPoint& last = sorted.back();
        return { last.temp, last.dew };
    }
    if (after == sorted.begin()) {
        return { after->temp, after->dew };
    }

    const HourlyPoint& before = *(after - 1);
    double span = after->hour - before.hour;
    if (span == 0.0) {
        return { after->temp, after->dew };
    }

    double fraction = (target_hour - before.hour) / span;
    return { Lerp(before.temp, after->temp, fraction), Lerp(before.dew, after->dew, fraction) };
}

RawReading ValueAt(const YearSeries& series, double target_hour) {
    return ValueAt(SortedPoints(series.samples), target_hour);
}

} // namespace SeriesResampler

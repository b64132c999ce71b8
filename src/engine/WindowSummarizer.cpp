#include "engine/WindowSummarizer.h"

#include "engine/MetricDeriver.h"
#include "engine/SeriesResampler.h"

#include <algorithm>

namespace WindowSummarizer {

namespace {

GradientStop MakeStop(double temp, double dew, Metric metric, Unit unit) {
    GradientStop stop;
    stop.val = MetricDeriver::Derive(temp, dew, metric, unit);
    stop.raw_sum_f = temp + dew;
    stop.severity = ColorClassifier::Classify(stop.raw_sum_f);
    return stop;
}

} // namespace

WindowSummary Summarize(const YearSeries& series,
                        double start_hour,
                        double end_hour,
                        Metric metric,
                        Unit unit) {
    std::vector<HourlyPoint> sorted = SeriesResampler::SortedPoints(series.samples);

    RawReading start = SeriesResampler::ValueAt(sorted, start_hour);
    RawReading end = SeriesResampler::ValueAt(sorted, end_hour);

    WindowSummary summary;
    summary.points.push_back(MakeStop(start.temp, start.dew, metric, unit));
    for (const auto& p : sorted) {
        if (p.hour > start_hour && p.hour < end_hour) {
            summary.points.push_back(MakeStop(p.temp, p.dew, metric, unit));
        }
    }
    summary.points.push_back(MakeStop(end.temp, end.dew, metric, unit));

    auto bounds = std::minmax_element(summary.points.begin(), summary.points.end(),
                                      [](const GradientStop& a, const GradientStop& b) {
                                          return a.val < b.val;
                                      });
    summary.min_val = bounds.first->val;
    summary.max_val = bounds.second->val;

    std::stable_sort(summary.points.begin(), summary.points.end(),
                     [](const GradientStop& a, const GradientStop& b) {
                         return a.val > b.val;
                     });
    return summary;
}

} // namespace WindowSummarizer

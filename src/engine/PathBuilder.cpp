#include "engine/PathBuilder.h"

#include "engine/MetricDeriver.h"

#include <algorithm>

namespace PathBuilder {

std::vector<HourlyPoint> Build(const YearSeries& series, double view_start_hour, double view_end_hour) {
    std::vector<HourlyPoint> sorted = SeriesResampler::SortedPoints(series.samples);
    std::vector<HourlyPoint> path;
    path.reserve(sorted.size() + 2);

    RawReading start = SeriesResampler::ValueAt(sorted, view_start_hour);
    path.push_back({ view_start_hour, start.temp, start.dew });

    for (const auto& p : sorted) {
        if (p.hour > view_start_hour && p.hour < view_end_hour) {
            path.push_back(p);
        }
    }

    RawReading end = SeriesResampler::ValueAt(sorted, view_end_hour);
    path.push_back({ view_end_hour, end.temp, end.dew });

    if (path.size() < 2) {
        path.clear();
    }
    return path;
}

std::vector<PlotPoint> DeriveValues(const std::vector<HourlyPoint>& points, Metric metric, Unit unit) {
    std::vector<PlotPoint> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back({ p.hour, MetricDeriver::Derive(p.temp, p.dew, metric, unit) });
    }
    return out;
}

std::vector<CubicSegment> SmoothSegments(const std::vector<PlotPoint>& points) {
    std::vector<CubicSegment> segments;
    if (points.size() < 2) {
        return segments;
    }
    segments.reserve(points.size() - 1);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const PlotPoint& p0 = points[i];
        const PlotPoint& p1 = points[i + 1];
        double half_dx = (p1.x - p0.x) * 0.5;

        CubicSegment seg;
        seg.from = p0;
        seg.control1 = { p0.x + half_dx, p0.y };
        seg.control2 = { p1.x - half_dx, p1.y };
        seg.to = p1;
        segments.push_back(seg);
    }
    return segments;
}

PlotPoint Evaluate(const CubicSegment& segment, double t) {
    double u = 1.0 - t;
    double b0 = u * u * u;
    double b1 = 3.0 * u * u * t;
    double b2 = 3.0 * u * t * t;
    double b3 = t * t * t;
    return {
        b0 * segment.from.x + b1 * segment.control1.x + b2 * segment.control2.x + b3 * segment.to.x,
        b0 * segment.from.y + b1 * segment.control1.y + b2 * segment.control2.y + b3 * segment.to.y
    };
}

std::vector<PlotPoint> Flatten(const std::vector<CubicSegment>& segments, int steps_per_segment) {
    std::vector<PlotPoint> strip;
    if (segments.empty()) {
        return strip;
    }
    int steps = std::max(1, steps_per_segment);
    strip.reserve(segments.size() * steps + 1);
    strip.push_back(segments.front().from);
    for (const auto& seg : segments) {
        for (int k = 1; k < steps; ++k) {
            strip.push_back(Evaluate(seg, static_cast<double>(k) / steps));
        }
        strip.push_back(seg.to);
    }
    return strip;
}

} // namespace PathBuilder

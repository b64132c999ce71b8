#pragma once

#include "engine/SeriesResampler.h"
#include "model/RaceData.h"

#include <vector>

struct PlotPoint {
    double x = 0.0;
    double y = 0.0;
};

// Cubic Bezier from `from` to `to`.
struct CubicSegment {
    PlotPoint from;
    PlotPoint control1;
    PlotPoint control2;
    PlotPoint to;
};

namespace PathBuilder {

// Interpolated value at view_start, raw samples strictly inside the view, then
// the interpolated value at view_end. Empty when fewer than two points result.
std::vector<HourlyPoint> Build(const YearSeries& series, double view_start_hour, double view_end_hour);

// x = hour, y = derived display value.
std::vector<PlotPoint> DeriveValues(const std::vector<HourlyPoint>& points, Metric metric, Unit unit);

// Horizontal tangents at each point, control points at the segment midpoint x.
// The curve passes through every input point.
std::vector<CubicSegment> SmoothSegments(const std::vector<PlotPoint>& points);

PlotPoint Evaluate(const CubicSegment& segment, double t);

// Line strip approximation; every input point appears exactly.
std::vector<PlotPoint> Flatten(const std::vector<CubicSegment>& segments, int steps_per_segment);
}

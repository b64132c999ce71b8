#pragma once

#include "engine/ColorClassifier.h"
#include "model/RaceData.h"

#include <vector>

struct GradientStop {
    double val = 0.0;       // display value (metric + unit)
    double raw_sum_f = 0.0; // temp + dew in Fahrenheit
    Severity severity = Severity::Ideal;
};

struct WindowSummary {
    double min_val = 0.0;
    double max_val = 0.0;
    std::vector<GradientStop> points; // descending by val
};

namespace WindowSummarizer {

// Interpolated values at both window edges plus every sample strictly inside.
// A zero-width window yields min_val == max_val; no visual padding is added.
WindowSummary Summarize(const YearSeries& series,
                        double start_hour,
                        double end_hour,
                        Metric metric,
                        Unit unit);
}

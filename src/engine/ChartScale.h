#pragma once

#include "engine/MetricDeriver.h"
#include "model/RaceData.h"

#include <vector>

struct PlotArea {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
};

struct BarSpan {
    int top = 0;
    int bottom = 0;
};

struct ViewWindow {
    double race_start_hour = 0.0;
    double race_end_hour = 0.0;
    double view_start_hour = 0.0;
    double view_end_hour = 0.0;
};

namespace ChartScale {

// Margin shown before the start and after the finish on the hourly chart.
constexpr double kViewPaddingHours = 0.5;

// Anchored on the first (most recent) year of the race.
ViewWindow HourlyWindow(const RaceDataset& race, const ChartSettings& settings);

double MapX(const PlotArea& area, double hour, double start_hour, double end_hour);
// High values map to the top of the area.
double MapY(const PlotArea& area, double value, const MetricDeriver::Domain& domain);

std::vector<int> HourTicks(double start_hour, double end_hour);
std::vector<int> ValueTicks(const MetricDeriver::Domain& domain);

constexpr int kMaxBarWidth = 14;

// Half the slot, between 4 px and kMaxBarWidth.
int BarWidth(double slot_w);

// Grows a span shorter than `bar_w` around its middle to exactly `bar_w`,
// so a flat window still reads as a pill.
BarSpan PillSpan(int top, int bottom, int bar_w);
}

#include "engine/ChartScale.h"

#include "util/TimeCodec.h"

#include <algorithm>
#include <cmath>

namespace ChartScale {

ViewWindow HourlyWindow(const RaceDataset& race, const ChartSettings& settings) {
    ViewWindow window;
    window.race_start_hour = race.history.empty()
                                 ? TimeCodec::kDefaultHour
                                 : TimeCodec::StartHour(race.history.front(), settings.time_mode, settings.mass_offset_min);
    window.race_end_hour = window.race_start_hour + settings.duration_hours;
    window.view_start_hour = window.race_start_hour - kViewPaddingHours;
    window.view_end_hour = window.race_end_hour + kViewPaddingHours;
    return window;
}

double MapX(const PlotArea& area, double hour, double start_hour, double end_hour) {
    double span = end_hour - start_hour;
    if (span <= 0.0) {
        return area.x;
    }
    return area.x + (hour - start_hour) / span * area.w;
}

double MapY(const PlotArea& area, double value, const MetricDeriver::Domain& domain) {
    double span = domain.max - domain.min;
    if (span <= 0.0) {
        return area.y + area.h * 0.5;
    }
    double normalized = (value - domain.min) / span;
    return area.y + (1.0 - normalized) * area.h;
}

std::vector<int> HourTicks(double start_hour, double end_hour) {
    std::vector<int> ticks;
    for (int h = static_cast<int>(std::ceil(start_hour)); h <= static_cast<int>(std::floor(end_hour)); ++h) {
        ticks.push_back(h);
    }
    return ticks;
}

std::vector<int> ValueTicks(const MetricDeriver::Domain& domain) {
    std::vector<int> ticks;
    int first = static_cast<int>(std::floor(domain.min / 10.0)) * 10;
    int last = static_cast<int>(std::ceil(domain.max / 10.0)) * 10;
    for (int t = first; t <= last; t += 10) {
        if (t >= domain.min && t <= domain.max) {
            ticks.push_back(t);
        }
    }
    return ticks;
}

int BarWidth(double slot_w) {
    return std::clamp(static_cast<int>(slot_w * 0.5), 4, kMaxBarWidth);
}

BarSpan PillSpan(int top, int bottom, int bar_w) {
    if (bottom - top >= bar_w) {
        return { top, bottom };
    }
    int mid = (top + bottom) / 2;
    return { mid - bar_w / 2, mid - bar_w / 2 + bar_w };
}

} // namespace ChartScale

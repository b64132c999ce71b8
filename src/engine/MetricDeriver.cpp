#include "engine/MetricDeriver.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace MetricDeriver {

namespace {

constexpr double kSumOriginF = 64.0;
constexpr double kTempOriginF = 32.0;
constexpr double kPaceThresholdF = 120.0;

double OriginFor(Metric metric) {
    return metric == Metric::Sum ? kSumOriginF : kTempOriginF;
}

double BufferFor(Metric metric, Unit unit) {
    if (unit == Unit::F) {
        return metric == Metric::Sum ? 10.0 : 5.0;
    }
    return metric == Metric::Sum ? 5.0 : 3.0;
}

} // namespace

double Derive(double temp_f, double dew_f, Metric metric, Unit unit) {
    double value = metric == Metric::Sum ? temp_f + dew_f : temp_f;
    if (unit == Unit::C) {
        value = (value - OriginFor(metric)) * (5.0 / 9.0);
    }
    return value;
}

double FromDisplay(double value, Metric metric, Unit unit) {
    if (unit == Unit::C) {
        return value * (9.0 / 5.0) + OriginFor(metric);
    }
    return value;
}

Domain ValueDomain(const std::vector<RaceDataset>& races, Metric metric, Unit unit) {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    bool any = false;

    for (const auto& race : races) {
        for (const auto& year : race.history) {
            for (const auto& sample : year.samples) {
                double value = Derive(sample.temperature_f, sample.dew_point_f, metric, unit);
                lo = std::min(lo, value);
                hi = std::max(hi, value);
                any = true;
            }
        }
    }

    if (!any) {
        return unit == Unit::F ? Domain{ -5.0, 35.0 } : Domain{ -20.0, 5.0 };
    }

    double buffer = BufferFor(metric, unit);
    return Domain{ std::floor(lo) - buffer, std::ceil(hi) + buffer };
}

double PaceThreshold(Unit unit) {
    return unit == Unit::F ? kPaceThresholdF : (kPaceThresholdF - kSumOriginF) * 5.0 / 9.0;
}

bool ShowPaceThreshold(Metric metric, Unit unit, const Domain& domain) {
    if (metric != Metric::Sum) {
        return false;
    }
    double threshold = PaceThreshold(unit);
    return threshold >= domain.min && threshold <= domain.max;
}

bool MetricFromName(const std::string& name, Metric* out) {
    if (name == "temp") {
        *out = Metric::Temp;
    } else if (name == "sum") {
        *out = Metric::Sum;
    } else {
        return false;
    }
    return true;
}

bool UnitFromName(const std::string& name, Unit* out) {
    if (name == "F" || name == "f") {
        *out = Unit::F;
    } else if (name == "C" || name == "c") {
        *out = Unit::C;
    } else {
        return false;
    }
    return true;
}

const char* UnitSymbol(Unit unit) {
    return unit == Unit::F ? "F" : "C";
}

} // namespace MetricDeriver

#pragma once

#include "model/RaceData.h"

#include <vector>

namespace MetricDeriver {

struct Domain {
    double min = 0.0;
    double max = 0.0;
};

// Raw value is temp (Temp) or temp + dew (Sum). Celsius conversion is applied
// to the combined value with a 64F origin for Sum and 32F for Temp.
double Derive(double temp_f, double dew_f, Metric metric, Unit unit);

// Inverse of the unit step in Derive: display value back to the Fahrenheit scale.
double FromDisplay(double value, Metric metric, Unit unit);

// Shared value axis across every race and year, padded by a per-mode buffer.
Domain ValueDomain(const std::vector<RaceDataset>& races, Metric metric, Unit unit);

// 120F temp+dew pace-impact threshold expressed in the display unit.
double PaceThreshold(Unit unit);
bool ShowPaceThreshold(Metric metric, Unit unit, const Domain& domain);

bool MetricFromName(const std::string& name, Metric* out);
bool UnitFromName(const std::string& name, Unit* out);
const char* UnitSymbol(Unit unit);
}

#pragma once

#include "model/RaceData.h"

enum class ConditionIcon { Sun, PartlySunny, Overcast, Rain, Snow };

namespace ConditionsSummary {

// Representative icon for the samples inside [start_hour, end_hour]; falls
// back to the whole day when no sample lies inside the window.
ConditionIcon IconForWindow(const YearSeries& series, double start_hour, double end_hour);

const char* IconKey(ConditionIcon icon);
}

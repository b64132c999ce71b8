#pragma once

#include <cstdint>

enum class Severity { Ideal, Caution, Danger };

struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

namespace ColorClassifier {

// Always evaluated on the Fahrenheit temp + dew sum, whatever the display metric.
Severity Classify(double raw_sum_f);

RgbColor SeverityColor(Severity severity);
const char* SeverityName(Severity severity);

// Light red for the oldest year through dark red for the newest.
RgbColor YearColor(int index, int total);
}

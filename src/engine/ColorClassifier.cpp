#include "engine/ColorClassifier.h"

#include <cmath>

namespace ColorClassifier {

namespace {

constexpr double kIdealBelowF = 100.0;
constexpr double kCautionUpToF = 120.0;

uint8_t Blend(int from, int to, double t) {
    return static_cast<uint8_t>(std::lround(from + t * (to - from)));
}

} // namespace

Severity Classify(double raw_sum_f) {
    if (raw_sum_f < kIdealBelowF) {
        return Severity::Ideal;
    }
    if (raw_sum_f <= kCautionUpToF) {
        return Severity::Caution;
    }
    return Severity::Danger;
}

RgbColor SeverityColor(Severity severity) {
    switch (severity) {
        case Severity::Ideal: return { 0x10, 0xb9, 0x81 };
        case Severity::Caution: return { 0xf9, 0x73, 0x16 };
        case Severity::Danger: return { 0xef, 0x44, 0x44 };
    }
    return { 0xef, 0x44, 0x44 };
}

const char* SeverityName(Severity severity) {
    switch (severity) {
        case Severity::Ideal: return "Ideal";
        case Severity::Caution: return "Caution";
        case Severity::Danger: return "Danger";
    }
    return "Danger";
}

RgbColor YearColor(int index, int total) {
    if (total <= 1) {
        return { 0xdc, 0x26, 0x26 };
    }
    double t = static_cast<double>(index) / (total - 1);
    return { Blend(252, 69, t), Blend(165, 10, t), Blend(165, 10, t) };
}

} // namespace ColorClassifier

#include "engine/ConditionsSummary.h"

#include "util/TimeCodec.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace ConditionsSummary {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

ConditionIcon IconForWindow(const YearSeries& series, double start_hour, double end_hour) {
    std::string inside;
    std::string all;
    for (const auto& sample : series.samples) {
        std::string text = ToLower(sample.conditions);
        all += text + " ";
        double t = TimeCodec::Parse(sample.clock_time);
        if (t >= start_hour && t <= end_hour) {
            inside += text + " ";
        }
    }

    const std::string& combined = inside.empty() ? all : inside;
    if (combined.find("snow") != std::string::npos) {
        return ConditionIcon::Snow;
    }
    if (combined.find("rain") != std::string::npos) {
        return ConditionIcon::Rain;
    }
    if (combined.find("overcast") != std::string::npos) {
        return ConditionIcon::Overcast;
    }
    if (combined.find("partially") != std::string::npos) {
        return ConditionIcon::PartlySunny;
    }
    return ConditionIcon::Sun;
}

const char* IconKey(ConditionIcon icon) {
    switch (icon) {
        case ConditionIcon::Sun: return "sun";
        case ConditionIcon::PartlySunny: return "partly_sunny";
        case ConditionIcon::Overcast: return "overcast";
        case ConditionIcon::Rain: return "rain";
        case ConditionIcon::Snow: return "snow";
    }
    return "sun";
}

} // namespace ConditionsSummary

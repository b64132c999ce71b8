#include "engine/ColorClassifier.h"
#include "engine/ConditionsSummary.h"

#include <iostream>
#include <string>

namespace {

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[classification-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool same_color(const RgbColor& c, int r, int g, int b) {
    return c.r == r && c.g == g && c.b == b;
}

int test_thresholds() {
    int failures = 0;
    failures += expect_true(ColorClassifier::Classify(40.0) == Severity::Ideal, "cool morning is Ideal");
    failures += expect_true(ColorClassifier::Classify(99.99) == Severity::Ideal, "just below 100 is Ideal");
    failures += expect_true(ColorClassifier::Classify(100.0) == Severity::Caution, "100 is Caution");
    failures += expect_true(ColorClassifier::Classify(115.0) == Severity::Caution, "115 is Caution");
    failures += expect_true(ColorClassifier::Classify(120.0) == Severity::Caution, "120 is still Caution");
    failures += expect_true(ColorClassifier::Classify(120.01) == Severity::Danger, "just above 120 is Danger");
    failures += expect_true(ColorClassifier::Classify(150.0) == Severity::Danger, "150 is Danger");
    return failures;
}

int test_severity_colors() {
    int failures = 0;
    failures += expect_true(same_color(ColorClassifier::SeverityColor(Severity::Ideal), 0x10, 0xb9, 0x81), "ideal green");
    failures += expect_true(same_color(ColorClassifier::SeverityColor(Severity::Caution), 0xf9, 0x73, 0x16),
                            "caution orange");
    failures += expect_true(same_color(ColorClassifier::SeverityColor(Severity::Danger), 0xef, 0x44, 0x44), "danger red");
    failures += expect_true(std::string(ColorClassifier::SeverityName(Severity::Caution)) == "Caution", "severity name");
    return failures;
}

int test_year_ramp() {
    int failures = 0;
    failures += expect_true(same_color(ColorClassifier::YearColor(0, 1), 0xdc, 0x26, 0x26), "single year uses solid red");
    failures += expect_true(same_color(ColorClassifier::YearColor(0, 5), 252, 165, 165), "oldest year is lightest");
    failures += expect_true(same_color(ColorClassifier::YearColor(4, 5), 69, 10, 10), "newest year is darkest");

    RgbColor mid = ColorClassifier::YearColor(1, 3);
    failures += expect_true(mid.r > 69 && mid.r < 252 && mid.g > 10 && mid.g < 165, "middle year is in between");
    for (int i = 1; i < 6; ++i) {
        failures += expect_true(ColorClassifier::YearColor(i, 6).r < ColorClassifier::YearColor(i - 1, 6).r,
                                "ramp darkens with each year");
    }
    return failures;
}

WeatherSample make_sample(const std::string& time, const std::string& conditions) {
    WeatherSample sample;
    sample.clock_time = time;
    sample.conditions = conditions;
    return sample;
}

int test_conditions_icon() {
    int failures = 0;
    YearSeries year;
    year.samples.push_back(make_sample("07:00", "Snow, Overcast"));
    year.samples.push_back(make_sample("09:00", "Partially cloudy"));
    year.samples.push_back(make_sample("10:00", "Clear"));
    year.samples.push_back(make_sample("13:00", "Rain, Overcast"));

    failures += expect_true(ConditionsSummary::IconForWindow(year, 9.0, 12.0) == ConditionIcon::PartlySunny,
                            "partial cloud inside the window");
    failures += expect_true(ConditionsSummary::IconForWindow(year, 10.0, 13.0) == ConditionIcon::Rain,
                            "window end is inclusive");
    failures += expect_true(ConditionsSummary::IconForWindow(year, 10.0, 11.0) == ConditionIcon::Sun,
                            "clear sky is sun");
    failures += expect_true(ConditionsSummary::IconForWindow(year, 15.0, 16.0) == ConditionIcon::Snow,
                            "empty window falls back to every sample");
    failures += expect_true(std::string(ConditionsSummary::IconKey(ConditionIcon::PartlySunny)) == "partly_sunny",
                            "sprite key");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_thresholds();
    failures += test_severity_colors();
    failures += test_year_ramp();
    failures += test_conditions_icon();

    if (failures > 0) {
        std::cerr << "[classification-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[classification-regression] all checks passed" << std::endl;
    return 0;
}

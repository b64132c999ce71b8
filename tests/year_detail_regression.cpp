#include "engine/YearDetail.h"

#include <cmath>
#include <iostream>
#include <string>

namespace {

bool nearly_equal(double a, double b, double tol = 1.0e-9) {
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[year-detail-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

WeatherSample make_sample(const std::string& time, double temp, double dew) {
    WeatherSample sample;
    sample.clock_time = time;
    sample.temperature_f = temp;
    sample.dew_point_f = dew;
    return sample;
}

YearSeries make_year() {
    YearSeries year;
    year.year = 2023;
    year.race_date = "2023-04-23";
    year.start_time_mass = "09:00";
    year.samples.push_back(make_sample("08:00", 60.0, 50.0));
    year.samples.push_back(make_sample("12:00", 74.0, 60.0));
    year.samples.push_back(make_sample("09:00", 65.0, 55.0));
    year.samples.push_back(make_sample("10:00", 70.0, 58.0));
    return year;
}

int test_start_and_finish_readings() {
    int failures = 0;
    ChartSettings settings;
    settings.duration_hours = 3.0;
    YearReadings r = YearDetail::Compute(make_year(), settings);

    failures += expect_true(r.year == 2023 && r.race_date == "2023-04-23", "year and date carried through");
    failures += expect_true(nearly_equal(r.start_hour, 9.0) && nearly_equal(r.finish_hour, 12.0), "window hours");
    failures += expect_true(nearly_equal(r.start.temp, 65.0) && nearly_equal(r.start.dew, 55.0), "start reading");
    failures += expect_true(nearly_equal(r.finish.temp, 74.0) && nearly_equal(r.finish.dew, 60.0), "finish reading");

    settings.duration_hours = 2.5;
    YearReadings mid = YearDetail::Compute(make_year(), settings);
    failures += expect_true(nearly_equal(mid.finish.temp, 72.0) && nearly_equal(mid.finish.dew, 59.0),
                            "finish between samples is interpolated");
    return failures;
}

int test_celsius_converts_each_component() {
    int failures = 0;
    ChartSettings settings;
    settings.unit = Unit::C;
    YearReadings r = YearDetail::Compute(make_year(), settings);

    failures += expect_true(nearly_equal(r.start.temp, (65.0 - 32.0) * 5.0 / 9.0), "temperature uses a 32F origin");
    failures += expect_true(nearly_equal(r.start.dew, (55.0 - 32.0) * 5.0 / 9.0), "dew point uses a 32F origin");
    return failures;
}

int test_describe() {
    int failures = 0;
    ChartSettings settings;
    YearReadings r = YearDetail::Compute(make_year(), settings);
    std::string line = YearDetail::Describe(r, Unit::F);
    failures += expect_true(line == "2023 (2023-04-23)  Start 9:00am 65.0/55.0F  Finish 12:00pm 74.0/60.0F",
                            "detail line: " + line);

    YearSeries bare;
    bare.year = 2019;
    YearReadings empty = YearDetail::Compute(bare, settings);
    failures += expect_true(empty.start.temp == 0.0 && empty.finish.dew == 0.0, "year without samples reads as zero");
    failures += expect_true(YearDetail::Describe(empty, Unit::F).find("2019  Start 9:00am") == 0,
                            "missing date is left out");
    return failures;
}

int test_selection_cycle() {
    int failures = 0;
    std::vector<RaceDataset> races(2);
    races[0].history.resize(2);
    races[0].history[0].year = 2024;
    races[0].history[1].year = 2023;
    races[1].history.resize(2);
    races[1].history[0].year = 2023;
    races[1].history[1].year = 2021;

    std::vector<int> years = YearDetail::AllYears(races);
    failures += expect_true(years.size() == 3 && years[0] == 2024 && years[1] == 2023 && years[2] == 2021,
                            "distinct years newest first");

    failures += expect_true(YearDetail::StepSelection(years, 0, 1) == 2024, "first step selects the newest year");
    failures += expect_true(YearDetail::StepSelection(years, 2024, 1) == 2023, "step forward");
    failures += expect_true(YearDetail::StepSelection(years, 2021, 1) == 0, "stepping past the oldest clears");
    failures += expect_true(YearDetail::StepSelection(years, 0, -1) == 2021, "stepping back wraps to the oldest");
    failures += expect_true(YearDetail::StepSelection(years, 1999, 1) == 2024, "unknown year restarts the cycle");
    failures += expect_true(YearDetail::StepSelection({}, 2024, 1) == 0, "no years, no selection");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_start_and_finish_readings();
    failures += test_celsius_converts_each_component();
    failures += test_describe();
    failures += test_selection_cycle();

    if (failures > 0) {
        std::cerr << "[year-detail-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[year-detail-regression] all checks passed" << std::endl;
    return 0;
}

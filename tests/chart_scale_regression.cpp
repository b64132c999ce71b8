#include "engine/ChartScale.h"
#include "util/TimeCodec.h"

#include <cmath>
#include <iostream>
#include <string>

namespace {

bool nearly_equal(double a, double b, double tol = 1.0e-9) {
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[chart-scale-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

RaceDataset make_race() {
    RaceDataset race;
    race.race_name = "Test Marathon";
    YearSeries latest;
    latest.year = 2024;
    latest.start_time_mass = "09:30";
    YearSeries older;
    older.year = 2023;
    older.start_time_mass = "07:00";
    race.history.push_back(latest);
    race.history.push_back(older);
    return race;
}

int test_hourly_window() {
    int failures = 0;
    ChartSettings settings;
    settings.duration_hours = 3.0;
    ViewWindow w = ChartScale::HourlyWindow(make_race(), settings);

    failures += expect_true(nearly_equal(w.race_start_hour, 9.5), "window anchored on the first year");
    failures += expect_true(nearly_equal(w.race_end_hour, 12.5), "end is start plus duration");
    failures += expect_true(nearly_equal(w.view_start_hour, 9.0), "half hour before the start");
    failures += expect_true(nearly_equal(w.view_end_hour, 13.0), "half hour after the finish");

    settings.mass_offset_min = 30;
    ViewWindow shifted = ChartScale::HourlyWindow(make_race(), settings);
    failures += expect_true(nearly_equal(shifted.race_start_hour, 10.0), "mass offset shifts the start");

    RaceDataset empty;
    ViewWindow fallback = ChartScale::HourlyWindow(empty, ChartSettings());
    failures += expect_true(nearly_equal(fallback.race_start_hour, TimeCodec::kDefaultHour),
                            "race without history starts at the default hour");
    return failures;
}

int test_mapping() {
    int failures = 0;
    PlotArea area;
    area.x = 40.0;
    area.y = 20.0;
    area.w = 400.0;
    area.h = 200.0;

    failures += expect_true(nearly_equal(ChartScale::MapX(area, 9.0, 9.0, 13.0), 40.0), "start maps to the left edge");
    failures += expect_true(nearly_equal(ChartScale::MapX(area, 13.0, 9.0, 13.0), 440.0), "end maps to the right edge");
    failures += expect_true(nearly_equal(ChartScale::MapX(area, 10.0, 9.0, 13.0), 140.0), "linear in between");
    failures += expect_true(nearly_equal(ChartScale::MapX(area, 10.0, 9.0, 9.0), 40.0), "empty span pins to the left");

    MetricDeriver::Domain domain;
    domain.min = 90.0;
    domain.max = 140.0;
    failures += expect_true(nearly_equal(ChartScale::MapY(area, 140.0, domain), 20.0), "max maps to the top");
    failures += expect_true(nearly_equal(ChartScale::MapY(area, 90.0, domain), 220.0), "min maps to the bottom");
    failures += expect_true(nearly_equal(ChartScale::MapY(area, 115.0, domain), 120.0), "midpoint maps to the centre");

    MetricDeriver::Domain flat;
    flat.min = 50.0;
    flat.max = 50.0;
    failures += expect_true(nearly_equal(ChartScale::MapY(area, 50.0, flat), 120.0), "flat domain maps to the centre");
    return failures;
}

int test_ticks() {
    int failures = 0;
    std::vector<int> hours = ChartScale::HourTicks(8.5, 12.5);
    failures += expect_true(hours.size() == 4 && hours.front() == 9 && hours.back() == 12, "whole hours inside");

    std::vector<int> exact = ChartScale::HourTicks(9.0, 11.0);
    failures += expect_true(exact.size() == 3, "window edges on the hour are included");

    MetricDeriver::Domain domain;
    domain.min = 85.0;
    domain.max = 132.0;
    std::vector<int> values = ChartScale::ValueTicks(domain);
    failures += expect_true(values.size() == 5 && values.front() == 90 && values.back() == 130,
                            "multiples of ten inside the domain");

    MetricDeriver::Domain negative;
    negative.min = -20.0;
    negative.max = 5.0;
    std::vector<int> celsius = ChartScale::ValueTicks(negative);
    failures += expect_true(celsius.size() == 3 && celsius.front() == -20 && celsius.back() == 0,
                            "negative domains tick from the bottom edge");
    return failures;
}

int test_bar_geometry() {
    int failures = 0;
    failures += expect_true(ChartScale::BarWidth(100.0) == 14, "wide slots cap the bar at 14 px");
    failures += expect_true(ChartScale::BarWidth(20.0) == 10, "bar is half the slot");
    failures += expect_true(ChartScale::BarWidth(3.0) == 4, "bar is at least 4 px");

    BarSpan flat = ChartScale::PillSpan(50, 50, 14);
    failures += expect_true(flat.top == 43 && flat.bottom == 57, "flat window grows to the bar width around its middle");

    BarSpan shallow = ChartScale::PillSpan(50, 55, 14);
    failures += expect_true(shallow.bottom - shallow.top == 14 && shallow.top == 45, "short span is as tall as wide");

    BarSpan tall = ChartScale::PillSpan(10, 100, 14);
    failures += expect_true(tall.top == 10 && tall.bottom == 100, "tall span is unchanged");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_hourly_window();
    failures += test_mapping();
    failures += test_ticks();
    failures += test_bar_geometry();

    if (failures > 0) {
        std::cerr << "[chart-scale-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[chart-scale-regression] all checks passed" << std::endl;
    return 0;
}

#pragma once

#include <string>
#include <vector>

// Raw values are stored in Fahrenheit; unit conversion happens only when a
// display value is derived.
struct WeatherSample {
    std::string clock_time; // "HH:MM[:SS]"
    double temperature_f = 0.0;
    double dew_point_f = 0.0;
    double wind_speed = 0.0;
    std::string conditions;
};

// Empty start-time strings mean "not published for that year".
struct YearSeries {
    int year = 0;
    std::string race_date; // YYYY-MM-DD
    std::string start_time_mass;
    std::string start_time_elite_men;
    std::string start_time_elite_women;
    std::string start_time_elite;
    std::vector<WeatherSample> samples;
};

struct RaceDataset {
    std::string id;
    std::string race_name;
    std::string location;
    std::vector<YearSeries> history;
};

enum class TimeMode { EliteMen, EliteWomen, Mass };
enum class Metric { Temp, Sum };
enum class Unit { F, C };
enum class ViewMode { Yearly, Hourly };

// User selections shared by every chart.
struct ChartSettings {
    double duration_hours = 3.0;
    TimeMode time_mode = TimeMode::Mass;
    int mass_offset_min = 0;
    Metric metric = Metric::Temp;
    Unit unit = Unit::F;
};

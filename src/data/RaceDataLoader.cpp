#include "data/RaceDataLoader.h"

#include "engine/RaceMetadata.h"
#include "util/TimeCodec.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <utility>

namespace {

double NumberOr(const nlohmann::json& item, const char* key, double fallback) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

std::string StringOr(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

WeatherSample ParseSample(const nlohmann::json& item) {
    WeatherSample sample;
    sample.clock_time = StringOr(item, "datetime");
    sample.temperature_f = NumberOr(item, "temp", 0.0);
    sample.dew_point_f = NumberOr(item, "dew", 0.0);
    sample.wind_speed = NumberOr(item, "windspeed", 0.0);
    sample.conditions = StringOr(item, "conditions");
    return sample;
}

YearSeries ParseYear(const nlohmann::json& item) {
    YearSeries year;
    year.year = static_cast<int>(NumberOr(item, "year", 0));
    year.race_date = StringOr(item, "date");
    year.start_time_mass = StringOr(item, "startTimeMass");
    year.start_time_elite_men = StringOr(item, "startTimeEliteMen");
    year.start_time_elite_women = StringOr(item, "startTimeEliteWomen");
    year.start_time_elite = StringOr(item, "startTimeElite");

    auto weather = item.find("weather");
    if (weather != item.end() && weather->is_array()) {
        for (const auto& sample : *weather) {
            if (!sample.is_object()) {
                std::cerr << "RaceDataLoader: skipping non-object sample in " << year.year << "\n";
                continue;
            }
            year.samples.push_back(ParseSample(sample));
        }
    }
    return year;
}

void PutIfSet(nlohmann::json& j, const char* key, const std::string& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

} // namespace

bool RaceDataLoader::LoadFromFile(const std::string& path, std::vector<RaceDataset>* out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) {
            *error = "cannot open " + path;
        }
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("parse failed: ") + ex.what();
        }
        return false;
    }
    return FromJson(j, out, error);
}

bool RaceDataLoader::LoadFromString(const std::string& text, std::vector<RaceDataset>* out, std::string* error) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        if (error) {
            *error = "invalid json";
        }
        return false;
    }
    return FromJson(j, out, error);
}

bool RaceDataLoader::FromJson(const nlohmann::json& root, std::vector<RaceDataset>* out, std::string* error) {
    if (!root.is_array()) {
        if (error) {
            *error = "dataset root is not an array";
        }
        return false;
    }

    std::vector<RaceDataset> races;
    for (const auto& item : root) {
        if (!item.is_object() || StringOr(item, "race").empty()) {
            if (error) {
                *error = "race entry without a name";
            }
            return false;
        }

        RaceDataset race;
        race.race_name = StringOr(item, "race");
        race.location = StringOr(item, "location");
        race.id = StringOr(item, "id");
        if (race.id.empty()) {
            race.id = RaceMetadata::Slugify(race.race_name);
        }

        auto history = item.find("history");
        if (history != item.end() && history->is_array()) {
            for (const auto& year : *history) {
                if (!year.is_object()) {
                    std::cerr << "RaceDataLoader: skipping non-object year in " << race.race_name << "\n";
                    continue;
                }
                race.history.push_back(ParseYear(year));
            }
        }
        races.push_back(std::move(race));
    }

    *out = std::move(races);
    return true;
}

nlohmann::json RaceDataLoader::ToJson(const std::vector<RaceDataset>& races) {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& race : races) {
        nlohmann::json r;
        r["id"] = race.id;
        r["race"] = race.race_name;
        r["location"] = race.location;
        r["history"] = nlohmann::json::array();
        for (const auto& year : race.history) {
            nlohmann::json y;
            y["year"] = year.year;
            y["date"] = year.race_date;
            y["startTimeMass"] = year.start_time_mass;
            PutIfSet(y, "startTimeEliteMen", year.start_time_elite_men);
            PutIfSet(y, "startTimeEliteWomen", year.start_time_elite_women);
            PutIfSet(y, "startTimeElite", year.start_time_elite);
            y["weather"] = nlohmann::json::array();
            for (const auto& sample : year.samples) {
                y["weather"].push_back({
                    { "datetime", sample.clock_time },
                    { "temp", sample.temperature_f },
                    { "dew", sample.dew_point_f },
                    { "windspeed", sample.wind_speed },
                    { "conditions", sample.conditions }
                });
            }
            r["history"].push_back(std::move(y));
        }
        root.push_back(std::move(r));
    }
    return root;
}

bool RaceDataLoader::SaveToFile(const std::string& path, const std::vector<RaceDataset>& races) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open dataset for write: " << path << "\n";
        return false;
    }
    file << ToJson(races).dump(2);
    if (!file.good()) {
        std::cerr << "Failed to write dataset: " << path << "\n";
        return false;
    }
    return true;
}

void RaceDataLoader::SortByRaceMonth(std::vector<RaceDataset>* races) {
    auto month_key = [](const RaceDataset& race) {
        if (race.history.empty()) {
            return 13;
        }
        int month = TimeCodec::MonthOfDate(race.history.front().race_date);
        return month == 0 ? 13 : month;
    };
    std::stable_sort(races->begin(), races->end(), [&](const RaceDataset& a, const RaceDataset& b) {
        return month_key(a) < month_key(b);
    });
}

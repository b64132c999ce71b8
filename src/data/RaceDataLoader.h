#pragma once

#include "model/RaceData.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

class RaceDataLoader {
public:
    static bool LoadFromFile(const std::string& path, std::vector<RaceDataset>* out, std::string* error);
    static bool LoadFromString(const std::string& text, std::vector<RaceDataset>* out, std::string* error);
    static bool FromJson(const nlohmann::json& root, std::vector<RaceDataset>* out, std::string* error);

    static nlohmann::json ToJson(const std::vector<RaceDataset>& races);
    static bool SaveToFile(const std::string& path, const std::vector<RaceDataset>& races);

    // Ascending by month of the most recent race date (history[0]); stable.
    static void SortByRaceMonth(std::vector<RaceDataset>* races);
};

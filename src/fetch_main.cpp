#include "data/RaceDataLoader.h"
#include "services/WeatherFetchService.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {

bool LoadFetchConfig(const std::string& path, FetchConfig* out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config: " << path << "\n";
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse config: " << ex.what() << "\n";
        return false;
    }

    out->api_key = j.value("api_key", out->api_key);
    out->cache_path = j.value("cache_path", out->cache_path);
    out->output_path = j.value("output_path", out->output_path);
    out->base_url = j.value("base_url", out->base_url);

    std::string error;
    if (!j.contains("races") || !RaceDataLoader::FromJson(j["races"], &out->races, &error)) {
        std::cerr << "Invalid race manifest in " << path << ": " << (error.empty() ? "races missing" : error) << "\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/fetch.json";
    bool refresh = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--refresh") {
            refresh = true;
        } else {
            config_path = arg;
        }
    }

    FetchConfig config;
    if (!LoadFetchConfig(config_path, &config)) {
        return 1;
    }
    config.refresh = refresh;

    for (const std::string& path : { config.cache_path, config.output_path }) {
        std::filesystem::path dir = std::filesystem::path(path).parent_path();
        std::error_code ec;
        if (!dir.empty() && !std::filesystem::create_directories(dir, ec) && ec) {
            std::cerr << "Failed to create " << dir << ": " << ec.message() << "\n";
            return 1;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "libcurl global init failed\n";
        return 1;
    }

    WeatherFetchService service(config);
    std::vector<RaceDataset> races;
    std::string error;
    bool ok = service.Run(&races, &error);
    curl_global_cleanup();

    if (!ok) {
        std::cerr << "Fetch incomplete: " << error << "\n";
        if (races.empty()) {
            return 1;
        }
    }

    RaceDataLoader::SortByRaceMonth(&races);
    if (!RaceDataLoader::SaveToFile(config.output_path, races)) {
        return 1;
    }
    std::cerr << "Wrote " << races.size() << " races to " << config.output_path << "\n";
    return ok ? 0 : 1;
}

#pragma once

#include "model/RaceData.h"

#include <curl/curl.h>

#include <string>
#include <vector>

class WeatherCache;

struct FetchConfig {
    std::string api_key;
    std::string cache_path = "./data/weather_cache.db";
    std::string output_path = "./data/marathon_data.json";
    std::string base_url = "https://weather.visualcrossing.com/VisualCrossingWebServices/rest/services/timeline/";
    bool refresh = false;
    // Race/year manifest; samples are filled in by the fetch.
    std::vector<RaceDataset> races;
};

// Fetches hourly race-day weather for every race-year in the manifest,
// reusing cached responses unless a refresh is requested.
class WeatherFetchService {
public:
    explicit WeatherFetchService(const FetchConfig& config);

    // Returns false if any race-year could not be fetched or parsed; those
    // years are still emitted, without samples.
    bool Run(std::vector<RaceDataset>* out, std::string* error);

    static std::string BuildTimelineUrl(CURL* curl,
                                        const std::string& base_url,
                                        const std::string& api_key,
                                        const std::string& location,
                                        const std::string& date);
    static bool ParseTimelineResponse(const std::string& body, std::vector<WeatherSample>* out, std::string* error);

    // Parses `body` and stores it in the cache only when it parses.
    static bool ParseAndCache(WeatherCache* cache,
                              const std::string& location,
                              const std::string& date,
                              const std::string& body,
                              std::vector<WeatherSample>* out,
                              std::string* error);

private:
    bool FetchDay(CURL* curl,
                  WeatherCache* cache,
                  const std::string& location,
                  const std::string& date,
                  std::vector<WeatherSample>* out,
                  std::string* error);

    FetchConfig config_;
};

#include "services/WeatherFetchService.h"

#include "db/WeatherCache.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <iostream>
#include <sstream>
#include <utility>

namespace {

struct HttpResponse {
    long code = 0;
    std::string body;
};

size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

bool HttpGet(CURL* curl, const std::string& url, HttpResponse* out) {
    out->body.clear();
    out->code = 0;

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out->body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "racewx/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        std::cerr << "Weather HTTP GET failed: " << curl_easy_strerror(res) << "\n";
        return false;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out->code);
    return true;
}

std::string Escape(CURL* curl, const std::string& text) {
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        return text;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

} // namespace

WeatherFetchService::WeatherFetchService(const FetchConfig& config) : config_(config) {}

std::string WeatherFetchService::BuildTimelineUrl(CURL* curl,
                                                  const std::string& base_url,
                                                  const std::string& api_key,
                                                  const std::string& location,
                                                  const std::string& date) {
    std::ostringstream out;
    out << base_url << Escape(curl, location) << "/" << date
        << "?unitGroup=us"
        << "&include=hours"
        << "&key=" << Escape(curl, api_key)
        << "&contentType=json";
    return out.str();
}

bool WeatherFetchService::ParseTimelineResponse(const std::string& body,
                                                std::vector<WeatherSample>* out,
                                                std::string* error) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (error) {
            *error = "weather invalid json";
        }
        return false;
    }
    if (!j.contains("days") || !j["days"].is_array() || j["days"].empty()) {
        if (error) {
            *error = "weather missing days";
        }
        return false;
    }

    const auto& day = j["days"][0];
    if (!day.is_object() || !day.contains("hours") || !day["hours"].is_array()) {
        if (error) {
            *error = "weather missing hours";
        }
        return false;
    }

    std::vector<WeatherSample> samples;
    for (const auto& hour : day["hours"]) {
        if (!hour.is_object() || !hour.contains("temp") || !hour["temp"].is_number()) {
            continue;
        }
        WeatherSample sample;
        sample.clock_time = (hour.contains("datetime") && hour["datetime"].is_string())
                                ? hour["datetime"].get<std::string>()
                                : "";
        sample.temperature_f = hour["temp"].get<double>();
        sample.dew_point_f = (hour.contains("dew") && hour["dew"].is_number()) ? hour["dew"].get<double>() : 0.0;
        sample.wind_speed = (hour.contains("windspeed") && hour["windspeed"].is_number())
                                ? hour["windspeed"].get<double>()
                                : 0.0;
        sample.conditions = (hour.contains("conditions") && hour["conditions"].is_string())
                                ? hour["conditions"].get<std::string>()
                                : "";
        samples.push_back(std::move(sample));
    }

    *out = std::move(samples);
    return true;
}

bool WeatherFetchService::ParseAndCache(WeatherCache* cache,
                                        const std::string& location,
                                        const std::string& date,
                                        const std::string& body,
                                        std::vector<WeatherSample>* out,
                                        std::string* error) {
    if (!ParseTimelineResponse(body, out, error)) {
        return false;
    }

    CachedResponse cached;
    cached.location = location;
    cached.date = date;
    cached.body = body;
    cached.fetched_ts = static_cast<int64_t>(std::time(nullptr));
    if (!cache->PutResponse(cached)) {
        std::cerr << "WeatherFetchService: failed to cache " << location << " " << date << "\n";
    }
    return true;
}

bool WeatherFetchService::FetchDay(CURL* curl,
                                   WeatherCache* cache,
                                   const std::string& location,
                                   const std::string& date,
                                   std::vector<WeatherSample>* out,
                                   std::string* error) {
    CachedResponse cached;
    if (!config_.refresh && cache->GetResponse(location, date, &cached) && !cached.body.empty()) {
        if (ParseTimelineResponse(cached.body, out, error)) {
            return true;
        }
        std::cerr << "WeatherFetchService: dropping unusable cached response for " << location << " " << date
                  << ": " << (error ? *error : "") << "\n";
        if (!cache->RemoveResponse(location, date)) {
            std::cerr << "WeatherFetchService: failed to evict " << location << " " << date << "\n";
        }
    }

    HttpResponse resp;
    std::string url = BuildTimelineUrl(curl, config_.base_url, config_.api_key, location, date);
    if (!HttpGet(curl, url, &resp)) {
        if (error) {
            *error = "weather http failed";
        }
        return false;
    }
    if (resp.code != 200) {
        if (error) {
            *error = "weather http " + std::to_string(resp.code);
        }
        return false;
    }

    // Only bodies that parse are cached, so a bad response is refetched next run.
    return ParseAndCache(cache, location, date, resp.body, out, error);
}

bool WeatherFetchService::Run(std::vector<RaceDataset>* out, std::string* error) {
    if (config_.api_key.empty()) {
        if (error) {
            *error = "api_key missing";
        }
        return false;
    }

    WeatherCache cache(config_.cache_path);
    if (!cache.Open()) {
        if (error) {
            *error = "cache open failed";
        }
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        if (error) {
            *error = "curl init failed";
        }
        return false;
    }

    int failures = 0;
    std::vector<RaceDataset> races = config_.races;
    for (auto& race : races) {
        for (auto& year : race.history) {
            std::string day_error;
            if (!FetchDay(curl, &cache, race.location, year.race_date, &year.samples, &day_error)) {
                std::cerr << "WeatherFetchService: " << race.race_name << " " << year.year
                          << ": " << day_error << "\n";
                ++failures;
                continue;
            }
            std::cerr << "WeatherFetchService: " << race.race_name << " " << year.year
                      << ": " << year.samples.size() << " samples\n";
        }
    }
    curl_easy_cleanup(curl);

    if (!cache.SetMeta("last_run_ts", std::to_string(static_cast<int64_t>(std::time(nullptr)))) ||
        !cache.SetMeta("last_run_failures", std::to_string(failures))) {
        std::cerr << "WeatherFetchService: failed to record run metadata\n";
    }

    *out = std::move(races);
    if (failures > 0) {
        if (error) {
            *error = std::to_string(failures) + " race-year(s) failed";
        }
        return false;
    }
    return true;
}

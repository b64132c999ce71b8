#include "db/WeatherCache.h"
#include "services/WeatherFetchService.h"

#include <curl/curl.h>

#include <iostream>
#include <string>

namespace {

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[weather-fetch-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int test_parse_timeline() {
    int failures = 0;
    const std::string body = R"({
      "address": "London, UK",
      "days": [
        {
          "datetime": "2024-04-21",
          "hours": [
            { "datetime": "08:00:00", "temp": 48.5, "dew": 41.0, "windspeed": 6.2, "conditions": "Overcast" },
            { "datetime": "09:00:00", "temp": null, "dew": 41.5 },
            { "datetime": "10:00:00", "temp": 52.0 }
          ]
        }
      ]
    })";

    std::vector<WeatherSample> samples;
    std::string error;
    failures += expect_true(WeatherFetchService::ParseTimelineResponse(body, &samples, &error), "valid body parses");
    failures += expect_true(samples.size() == 2, "hours without a temperature are skipped");
    if (samples.size() == 2) {
        failures += expect_true(samples[0].clock_time == "08:00:00" && samples[0].temperature_f == 48.5 &&
                                    samples[0].dew_point_f == 41.0 && samples[0].wind_speed == 6.2,
                                "numeric fields");
        failures += expect_true(samples[0].conditions == "Overcast", "conditions text");
        failures += expect_true(samples[1].dew_point_f == 0.0 && samples[1].conditions.empty(),
                                "missing optional fields default");
    }
    return failures;
}

int test_parse_errors() {
    int failures = 0;
    std::vector<WeatherSample> samples(3);
    std::string error;

    failures += expect_true(!WeatherFetchService::ParseTimelineResponse("<html>", &samples, &error), "html fails");
    failures += expect_true(error == "weather invalid json", "invalid json message");
    failures += expect_true(samples.size() == 3, "output untouched on failure");

    failures += expect_true(!WeatherFetchService::ParseTimelineResponse("{\"days\": []}", &samples, &error),
                            "empty days fails");
    failures += expect_true(error == "weather missing days", "missing days message");

    failures += expect_true(!WeatherFetchService::ParseTimelineResponse("{\"days\": [{}]}", &samples, &error),
                            "day without hours fails");
    failures += expect_true(error == "weather missing hours", "missing hours message");
    return failures;
}

int test_non_string_datetime() {
    int failures = 0;
    const std::string body = R"({"days":[{"hours":[{"datetime":8,"temp":50},{"datetime":"09:00:00","temp":52}]}]})";
    std::vector<WeatherSample> samples;
    std::string error;
    failures += expect_true(WeatherFetchService::ParseTimelineResponse(body, &samples, &error),
                            "numeric datetime does not abort parsing");
    failures += expect_true(samples.size() == 2, "both hours with a temperature are kept");
    if (samples.size() == 2) {
        failures += expect_true(samples[0].clock_time.empty(), "non-string datetime reads as empty");
        failures += expect_true(samples[1].clock_time == "09:00:00", "string datetime is kept");
    }
    return failures;
}

int test_only_parsed_bodies_are_cached() {
    int failures = 0;
    WeatherCache cache(":memory:");
    if (!cache.Open()) {
        return expect_true(false, "in-memory cache opens");
    }

    std::vector<WeatherSample> samples;
    std::string error;
    failures += expect_true(!WeatherFetchService::ParseAndCache(&cache, "Berlin, Germany", "2024-09-29",
                                                                "{\"message\": \"rate limited\"}", &samples, &error),
                            "unusable body is rejected");
    failures += expect_true(error == "weather missing days", "rejection reason: " + error);
    failures += expect_true(cache.CountResponses() == 0, "unusable body is not cached");

    const std::string good = R"({"days":[{"hours":[{"datetime":"09:00:00","temp":55.0,"dew":47.0}]}]})";
    failures += expect_true(WeatherFetchService::ParseAndCache(&cache, "Berlin, Germany", "2024-09-29", good,
                                                               &samples, &error),
                            "valid body is accepted");
    failures += expect_true(samples.size() == 1 && samples[0].temperature_f == 55.0, "valid body is parsed");

    CachedResponse stored;
    failures += expect_true(cache.GetResponse("Berlin, Germany", "2024-09-29", &stored) && stored.body == good,
                            "valid body is cached verbatim");
    failures += expect_true(stored.fetched_ts > 0, "cache entry carries a fetch time");
    return failures;
}

int test_timeline_url() {
    int failures = 0;
    CURL* curl = curl_easy_init();
    if (!curl) {
        return expect_true(false, "curl handle");
    }

    std::string url = WeatherFetchService::BuildTimelineUrl(
        curl, "https://example.test/timeline/", "k&y", "Boston, USA", "2024-04-15");
    curl_easy_cleanup(curl);

    failures += expect_true(url.find("https://example.test/timeline/Boston%2C%20USA/2024-04-15?") == 0,
                            "location is escaped into the path: " + url);
    failures += expect_true(url.find("unitGroup=us") != std::string::npos, "fahrenheit units requested");
    failures += expect_true(url.find("include=hours") != std::string::npos, "hourly data requested");
    failures += expect_true(url.find("key=k%26y") != std::string::npos, "api key is escaped");
    failures += expect_true(url.find("contentType=json") != std::string::npos, "json requested");
    return failures;
}

int test_run_without_key() {
    int failures = 0;
    FetchConfig config;
    WeatherFetchService service(config);
    std::vector<RaceDataset> out;
    std::string error;
    failures += expect_true(!service.Run(&out, &error), "run without an api key fails");
    failures += expect_true(error == "api_key missing", "api key message");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_parse_timeline();
    failures += test_parse_errors();
    failures += test_non_string_datetime();
    failures += test_only_parsed_bodies_are_cached();
    failures += test_timeline_url();
    failures += test_run_without_key();

    if (failures > 0) {
        std::cerr << "[weather-fetch-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[weather-fetch-regression] all checks passed" << std::endl;
    return 0;
}

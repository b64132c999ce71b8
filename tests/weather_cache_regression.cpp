#include "db/WeatherCache.h"

#include <iostream>
#include <string>

namespace {

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[weather-cache-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

CachedResponse make_response(const std::string& location, const std::string& date, const std::string& body) {
    CachedResponse response;
    response.location = location;
    response.date = date;
    response.body = body;
    response.fetched_ts = 1700000000;
    return response;
}

int test_responses() {
    int failures = 0;
    WeatherCache cache(":memory:");
    if (!cache.Open()) {
        return expect_true(false, "in-memory cache opens");
    }

    failures += expect_true(cache.CountResponses() == 0, "new cache is empty");
    failures += expect_true(cache.PutResponse(make_response("London, UK", "2024-04-21", "{\"a\":1}")), "put");
    failures += expect_true(cache.PutResponse(make_response("London, UK", "2023-04-23", "{\"b\":2}")), "put second");
    failures += expect_true(cache.CountResponses() == 2, "two responses");

    CachedResponse got;
    failures += expect_true(cache.GetResponse("London, UK", "2024-04-21", &got), "get existing");
    failures += expect_true(got.body == "{\"a\":1}" && got.fetched_ts == 1700000000, "stored fields");

    CachedResponse newer = make_response("London, UK", "2024-04-21", "{\"a\":3}");
    newer.fetched_ts = 1700000500;
    failures += expect_true(cache.PutResponse(newer), "upsert");
    failures += expect_true(cache.CountResponses() == 2, "upsert does not add a row");
    failures += expect_true(cache.GetResponse("London, UK", "2024-04-21", &got) && got.body == "{\"a\":3}" &&
                                got.fetched_ts == 1700000500,
                            "upsert replaces body and timestamp");

    CachedResponse missing;
    failures += expect_true(!cache.GetResponse("Boston, USA", "2024-04-15", &missing), "unknown key misses");

    failures += expect_true(cache.RemoveResponse("London, UK", "2023-04-23"), "remove");
    failures += expect_true(cache.CountResponses() == 1, "one response after remove");
    return failures;
}

int test_meta() {
    int failures = 0;
    WeatherCache cache(":memory:");
    if (!cache.Open()) {
        return expect_true(false, "in-memory cache opens");
    }

    failures += expect_true(cache.GetMeta("last_run_ts").empty(), "unset meta is empty");
    failures += expect_true(cache.SetMeta("last_run_ts", "100"), "set meta");
    failures += expect_true(cache.SetMeta("last_run_ts", "200"), "overwrite meta");
    failures += expect_true(cache.GetMeta("last_run_ts") == "200", "meta keeps the latest value");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_responses();
    failures += test_meta();

    if (failures > 0) {
        std::cerr << "[weather-cache-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[weather-cache-regression] all checks passed" << std::endl;
    return 0;
}

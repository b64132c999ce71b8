#pragma once

#include <cstdint>
#include <string>

struct sqlite3;

struct CachedResponse {
    std::string location;
    std::string date;
    std::string body;
    int64_t fetched_ts = 0;
};

// Raw weather API responses keyed by location + date, so a dataset can be
// rebuilt without refetching.
class WeatherCache {
public:
    explicit WeatherCache(const std::string& db_path);
    ~WeatherCache();

    bool Open();
    void Close();
    bool InitSchema();

    bool PutResponse(const CachedResponse& response);
    bool GetResponse(const std::string& location, const std::string& date, CachedResponse* out);
    bool RemoveResponse(const std::string& location, const std::string& date);
    int CountResponses();

    bool SetMeta(const std::string& key, const std::string& value);
    std::string GetMeta(const std::string& key);

private:
    bool Exec(const std::string& sql);

    std::string db_path_;
    sqlite3* db_ = nullptr;
};

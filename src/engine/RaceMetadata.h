#pragma once

#include <string>
#include <vector>

struct RaceInfo {
    std::string id;
    std::vector<int> rescheduled_years;
    std::string footnote;
};

struct CountryInfo {
    std::string name;
    std::string code;
};

namespace RaceMetadata {

// Stable identifier: lowercase, runs of non-alphanumerics collapsed to '-'.
std::string Slugify(const std::string& race_name);

// Races with no special handling get an entry with only the id filled in.
RaceInfo Lookup(const std::string& race_id);

// "2021*" for years held outside their usual date.
std::string YearLabel(const std::string& race_id, int year);

// Uses the last comma-separated token of "City, Country".
CountryInfo CountryForLocation(const std::string& location);
}

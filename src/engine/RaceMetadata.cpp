#include "engine/RaceMetadata.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace RaceMetadata {

namespace {

struct RaceEntry {
    const char* id;
    std::vector<int> rescheduled_years;
    const char* footnote;
};

const std::vector<RaceEntry>& RaceTable() {
    static const std::vector<RaceEntry> kRaces = {
        { "london-marathon", { 2020, 2021, 2022 },
          "*London Marathons in 2020, 2021, 2022 were held in October due to the Covid-19 pandemic" },
        { "boston-marathon", { 2021 },
          "*The 2021 Boston Marathon was held in October due to the Covid-19 pandemic" },
    };
    return kRaces;
}

struct CountryEntry {
    const char* name;
    const char* code;
};

const std::array<CountryEntry, 7> kCountries = {{
    { "USA", "US" },
    { "Japan", "JP" },
    { "UK", "GB" },
    { "Germany", "DE" },
    { "Australia", "AU" },
    { "Spain", "ES" },
    { "Netherlands", "NL" },
}};

std::string Trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

} // namespace

std::string Slugify(const std::string& race_name) {
    std::string slug;
    bool pending_dash = false;
    for (unsigned char c : race_name) {
        if (std::isalnum(c)) {
            if (pending_dash && !slug.empty()) {
                slug += '-';
            }
            pending_dash = false;
            slug += static_cast<char>(std::tolower(c));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

RaceInfo Lookup(const std::string& race_id) {
    RaceInfo info;
    info.id = race_id;
    for (const auto& entry : RaceTable()) {
        if (race_id == entry.id) {
            info.rescheduled_years = entry.rescheduled_years;
            info.footnote = entry.footnote;
            break;
        }
    }
    return info;
}

std::string YearLabel(const std::string& race_id, int year) {
    RaceInfo info = Lookup(race_id);
    bool rescheduled = std::find(info.rescheduled_years.begin(), info.rescheduled_years.end(), year) !=
                       info.rescheduled_years.end();
    return std::to_string(year) + (rescheduled ? "*" : "");
}

CountryInfo CountryForLocation(const std::string& location) {
    size_t comma = location.rfind(',');
    std::string country = Trim(comma == std::string::npos ? location : location.substr(comma + 1));

    CountryInfo info;
    info.name = country;
    for (const auto& entry : kCountries) {
        if (country == entry.name) {
            info.code = entry.code;
            break;
        }
    }
    return info;
}

} // namespace RaceMetadata

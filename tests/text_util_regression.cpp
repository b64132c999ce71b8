#include "util/TextUtil.h"

#include <iostream>
#include <string>

namespace {

int expect_true(bool cond, const std::string& message) {
    if (!cond) {
        std::cerr << "[text-util-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int test_utf8_boundary() {
    int failures = 0;
    // "Zürich": 'Z' then the two-byte 'ü' at offsets 1-2.
    const std::string city = "Z\xC3\xBCrich";
    failures += expect_true(TextUtil::Utf8Boundary(city, 2) == 1, "cut inside a two-byte sequence steps back");
    failures += expect_true(TextUtil::Utf8Boundary(city, 3) == 3, "cut after a full sequence is kept");
    failures += expect_true(TextUtil::Utf8Boundary(city, 1) == 1, "cut before the lead byte is kept");
    failures += expect_true(TextUtil::Utf8Boundary(city, 50) == city.size(), "cut past the end clamps to size");

    // "\xE6\x9D\xB1\xE4\xBA\xAC" is a pair of three-byte characters.
    const std::string tokyo = "\xE6\x9D\xB1\xE4\xBA\xAC";
    failures += expect_true(TextUtil::Utf8Boundary(tokyo, 5) == 3, "cut inside the second character steps to its lead");
    failures += expect_true(TextUtil::Utf8Boundary(tokyo, 2) == 0, "cut inside the first character gives zero");
    failures += expect_true(TextUtil::Utf8Boundary("plain", 3) == 3, "ascii cuts are unchanged");
    failures += expect_true(TextUtil::Utf8Boundary("", 0) == 0, "empty text has only offset zero");
    return failures;
}

int test_first_token() {
    int failures = 0;
    failures += expect_true(TextUtil::FirstToken("London, UK") == "London", "city precedes the comma");
    failures += expect_true(TextUtil::FirstToken("  Boston , Massachusetts, USA") == "Boston", "token is trimmed");
    failures += expect_true(TextUtil::FirstToken("Tokyo") == "Tokyo", "no comma keeps the whole text");
    failures += expect_true(TextUtil::FirstToken(" , UK").empty(), "blank city gives an empty token");
    return failures;
}

} // namespace

int main() {
    int failures = 0;
    failures += test_utf8_boundary();
    failures += test_first_token();

    if (failures > 0) {
        std::cerr << "[text-util-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[text-util-regression] all checks passed" << std::endl;
    return 0;
}

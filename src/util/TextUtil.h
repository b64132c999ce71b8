#pragma once

#include <cstddef>
#include <string>

namespace TextUtil {

// Largest UTF-8 codepoint boundary not past `len`, so text.substr(0, result)
// never ends inside a multi-byte sequence.
size_t Utf8Boundary(const std::string& text, size_t len);

// First comma-separated token of "City, Country", trimmed.
std::string FirstToken(const std::string& text);
}

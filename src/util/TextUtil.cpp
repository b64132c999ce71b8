#include "util/TextUtil.h"

namespace TextUtil {

size_t Utf8Boundary(const std::string& text, size_t len) {
    if (len >= text.size()) {
        return text.size();
    }
    while (len > 0 && (static_cast<unsigned char>(text[len]) & 0xC0) == 0x80) {
        --len;
    }
    return len;
}

std::string FirstToken(const std::string& text) {
    std::string token = text.substr(0, text.find(','));
    size_t start = token.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = token.find_last_not_of(" \t");
    return token.substr(start, end - start + 1);
}

} // namespace TextUtil

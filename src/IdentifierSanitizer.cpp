#include "IdentifierSanitizer.hpp"

namespace tablemap {

namespace {

// U+2153 VULGAR FRACTION ONE THIRD, UTF-8 encoded
constexpr std::string_view kOneThird = "\xE2\x85\x93";

constexpr std::string_view kTrimChars{" \t\r\n\v\0", 6};

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(kTrimChars);
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(kTrimChars);
    return str.substr(start, end - start + 1);
}

}  // namespace

std::string sanitizeIdentifier(std::string_view name) {
    std::string stripped;
    stripped.reserve(name.size());
    for (char c : name) {
        if (c != '*') {
            stripped += c;
        }
    }
    stripped = trim(stripped);

    std::string escaped;
    escaped.reserve(stripped.size());
    size_t pos = 0;
    while (pos < stripped.size()) {
        if (stripped.compare(pos, kOneThird.size(), kOneThird) == 0) {
            // Already-escaped occurrences stay as they are
            if (escaped.empty() || escaped.back() != '\\') {
                escaped += '\\';
            }
            escaped += kOneThird;
            pos += kOneThird.size();
        } else {
            escaped += stripped[pos++];
        }
    }

    return trim(escaped);
}

}  // namespace tablemap

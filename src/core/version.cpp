#include "hostext/core/version.h"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <vector>

namespace hostext {
namespace core {

namespace {

bool parseComponent(const std::string& token, uint16_t& out) {
    if (token.empty() || token.size() > 5) {
        return false;
    }
    unsigned long value = 0;
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    if (value > std::numeric_limits<uint16_t>::max()) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

bool tryParse(const std::string& text, Version& out) {
    // Drop the qualifier ("1.0.0-SNAPSHOT")
    const std::string numeric = text.substr(0, text.find('-'));

    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t dot = numeric.find('.', start);
        tokens.push_back(numeric.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (tokens.size() > 3) {
        return false;
    }

    uint16_t parts[3] = {0, 0, 0};
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!parseComponent(tokens[i], parts[i])) {
            return false;
        }
    }
    out = Version(parts[0], parts[1], parts[2]);
    return true;
}

} // namespace

Version Version::parse(const std::string& text) {
    Version parsed;
    if (!tryParse(text, parsed)) {
        throw std::invalid_argument("Invalid version: '" + text + "'");
    }
    return parsed;
}

bool Version::isValid(const std::string& text) {
    Version ignored;
    return tryParse(text, ignored);
}

} // namespace core
} // namespace hostext

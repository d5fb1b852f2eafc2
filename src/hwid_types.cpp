#include "hwid_types.hpp"

#include <algorithm>
#include <cctype>

namespace urhwid {

std::string HwidTypeUtils::normalize_value(const std::string& raw) {
    std::string result;
    result.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isspace(c)) continue;
        result.push_back(static_cast<char>(std::tolower(c)));
    }
    return result;
}

std::string HwidTypeUtils::to_lower(const std::string& raw) {
    std::string result = raw;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string HwidTypeUtils::trim(const std::string& raw) {
    size_t start = raw.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = raw.find_last_not_of(" \t\r\n\f\v");
    return raw.substr(start, end - start + 1);
}

} // namespace urhwid

/**
 * @file string_utils.cpp
 * @brief String helpers implementation
 *
 * @date 2025
 */

#include "quantlab/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace quantlab {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(str);

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return ToLower(str).find(ToLower(substring)) != std::string::npos;
}

std::string StringUtils::Tail(const std::string& str, std::size_t max_length) {
    if (str.size() <= max_length) {
        return str;
    }
    return str.substr(str.size() - max_length);
}

std::string StringUtils::ToValidUtf8(const std::string& str) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string result;
    result.reserve(str.size());

    std::size_t i = 0;
    while (i < str.size()) {
        auto lead = static_cast<unsigned char>(str[i]);

        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;    // overlong
            if (lead == 0xED) high = 0x9F;   // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;    // overlong
            if (lead == 0xF4) high = 0x8F;   // above U+10FFFF
        }

        bool valid = length > 0 && i + length <= str.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            auto c = static_cast<unsigned char>(str[i + k]);
            unsigned char min = (k == 1) ? low : 0x80;
            unsigned char max = (k == 1) ? high : 0xBF;
            valid = c >= min && c <= max;
        }

        if (valid) {
            result.append(str, i, length);
            i += length;
        } else {
            result += kReplacement;
            ++i;
        }
    }

    return result;
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string StringUtils::FormatTimestamp(std::chrono::system_clock::time_point time) {
    std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&raw, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string StringUtils::SanitizeName(const std::string& str) {
    std::string result = str;
    std::replace_if(result.begin(), result.end(),
                    [](unsigned char c) {
                        return !(std::isalnum(c) || c == '_' || c == '.' || c == '-');
                    },
                    '_');
    return result;
}

} // namespace utils
} // namespace quantlab

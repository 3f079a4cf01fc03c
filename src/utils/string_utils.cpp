/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace warden {
namespace utils {

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
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

// Join strings
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

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (suffix.length() >= max_length) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

// ============================================================================
// BYTE QUANTITIES
// ============================================================================
// "512m" style sizes as accepted by docker --memory

std::optional<std::uint64_t> StringUtils::ParseByteSize(const std::string& text) {
    std::string value = ToLower(Trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    std::size_t unit_pos = 0;
    while (unit_pos < value.size() &&
           (std::isdigit(static_cast<unsigned char>(value[unit_pos])) || value[unit_pos] == '.')) {
        ++unit_pos;
    }

    std::string number = value.substr(0, unit_pos);
    std::string unit = Trim(value.substr(unit_pos));
    if (number.empty() || std::count(number.begin(), number.end(), '.') > 1) {
        return std::nullopt;
    }

    std::uint64_t multiplier = 1;
    if (unit.empty() || unit == "b") {
        multiplier = 1;
    } else if (unit == "k" || unit == "kb") {
        multiplier = 1024ULL;
    } else if (unit == "m" || unit == "mb") {
        multiplier = 1024ULL * 1024;
    } else if (unit == "g" || unit == "gb") {
        multiplier = 1024ULL * 1024 * 1024;
    } else if (unit == "t" || unit == "tb") {
        multiplier = 1024ULL * 1024 * 1024 * 1024;
    } else {
        return std::nullopt;
    }

    try {
        const auto max_value = std::numeric_limits<std::uint64_t>::max();
        if (number.find('.') == std::string::npos) {
            const auto amount = static_cast<std::uint64_t>(std::stoull(number));
            if (amount > max_value / multiplier) {
                return std::nullopt;
            }
            return amount * multiplier;
        }
        const double bytes = std::stod(number) * static_cast<double>(multiplier);
        if (!(bytes < static_cast<double>(max_value))) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(std::llround(bytes));
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string StringUtils::FormatSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

} // namespace utils
} // namespace warden

/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation utilities
 *
 * @date 2025
 */

#include "algoscope/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace algoscope {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================
// Basic string operations: trimming, splitting, joining, replacing

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
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

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                   const std::string& from,
                                   const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

// Check if starts with
bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

// Contains substring
bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// STRING SANITIZATION AND TRUNCATION
// ============================================================================
// Preparing interpreter diagnostics for clients and logs

std::string StringUtils::FirstLine(const std::string& str) {
    auto pos = str.find_first_of("\r\n");
    return pos == std::string::npos ? str : str.substr(0, pos);
}

// Sanitize string for safe output
std::string StringUtils::Sanitize(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        } else {
            result += '.';
        }
    }

    return result;
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

std::string StringUtils::RedactSource(const std::string& message,
                                     const std::string& source,
                                     std::size_t min_line_length) {
    std::string result = message;

    std::istringstream lines(source);
    std::string line;
    while (std::getline(lines, line)) {
        auto trimmed = Trim(line);
        if (trimmed.length() < min_line_length) {
            continue;
        }
        if (Contains(result, trimmed)) {
            result = ReplaceAll(result, trimmed, "<source>");
        }
    }

    return result;
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string StringUtils::FormatNumber(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }

    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::string StringUtils::FormatIso8601(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace utils
} // namespace algoscope

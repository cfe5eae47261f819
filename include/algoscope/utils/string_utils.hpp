/**
 * @file string_utils.hpp
 * @brief String manipulation helpers used across the engine
 *
 * Trimming and joining for request validation and trace descriptions,
 * plus sanitisation helpers that turn interpreter diagnostics into short,
 * single-line messages safe to return to clients.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace algoscope {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto msg = StringUtils::Truncate(StringUtils::FirstLine(raw), 120);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace all occurrences of substring
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Sanitisation
     ***************************************************************************/

    /**
     * @brief First line of a (possibly multi-line) string
     */
    static std::string FirstLine(const std::string& str);

    /**
     * @brief Replace non-printable characters with '.'
     * @param str Input string
     * @return Sanitized string
     */
    static std::string Sanitize(const std::string& str);

    /**
     * @brief Truncate string to maximum length
     *
     * @param str Input string
     * @param max_length Maximum allowed length
     * @param suffix Suffix to append if truncated (default: "...")
     * @return Truncated string
     *
     * **Example**:
     * @code
     * auto short_str = StringUtils::Truncate("very long string here", 10);
     * // short_str = "very lo..."
     * @endcode
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Redact verbatim source lines from a diagnostic message
     *
     * Every line of @p source that is at least @p min_line_length characters
     * long after trimming and appears inside @p message is replaced with
     * "<source>".
     */
    static std::string RedactSource(const std::string& message, const std::string& source,
                                    std::size_t min_line_length = 8);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /**
     * @brief Shortest readable rendering of a number
     *
     * Integral values print without a fractional part ("5", not "5.0").
     */
    static std::string FormatNumber(double value);

    /**
     * @brief ISO-8601 UTC timestamp with millisecond precision
     *
     * Example: "2025-03-14T09:26:53.589Z"
     */
    static std::string FormatIso8601(std::chrono::system_clock::time_point time);
};

} // namespace utils
} // namespace algoscope

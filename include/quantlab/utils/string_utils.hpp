/**
 * @file string_utils.hpp
 * @brief String helpers shared by the sandbox, session and tool layers
 *
 * Small set of text utilities used when parsing container runtime output,
 * provisioning tool logs and notebook sources.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace quantlab {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * for (const auto& line : StringUtils::SplitLines(launch_output)) {
 *     if (StringUtils::ContainsIgnoreCase(line, "container")) {
 *         // ...
 *     }
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens (empty tokens are skipped)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines, keeping empty lines
     *
     * Handles both "\n" and "\r\n" line endings. A trailing newline does not
     * produce a final empty element.
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /// Case-insensitive substring search (ASCII only)
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Keep only the last @p max_length characters
     *
     * Used to bound error details copied from tool output into results.
     */
    static std::string Tail(const std::string& str, std::size_t max_length);

    /**
     * @brief Replace bytes that are not well-formed UTF-8 with U+FFFD
     *
     * Sandbox output is arbitrary bytes; JSON responses must be valid UTF-8.
     */
    static std::string ToValidUtf8(const std::string& str);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /**
     * @brief Format a wall-clock time as ISO-8601 UTC
     * @return String like "2025-01-31T12:00:00Z"
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);

    /**
     * @brief Replace characters not allowed in container names with '_'
     *
     * Container names accept [a-zA-Z0-9_.-].
     */
    static std::string SanitizeName(const std::string& str);
};

} // namespace utils
} // namespace quantlab

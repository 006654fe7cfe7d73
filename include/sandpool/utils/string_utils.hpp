/**
 * @file string_utils.hpp
 * @brief String helpers for configuration parsing and command construction
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace sandpool {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("base, browser", ',');   // ["base", "browser"]
 * bool on = StringUtils::ParseBool("yes").value_or(false); // true
 * auto env = StringUtils::ParseKeyValueList("a:1,b:2", ':');
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
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, trimming each part
     *
     * Empty parts are skipped.
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of substrings
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /***************************************************************************
     * Value Parsing
     ***************************************************************************/

    /**
     * @brief Parse a boolean setting
     *
     * Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
     *
     * @param str Input string
     * @return Parsed value or nullopt if unrecognized
     */
    static std::optional<bool> ParseBool(const std::string& str);

    /**
     * @brief Parse a base-10 integer, rejecting trailing garbage
     * @param str Input string
     * @return Parsed value or nullopt
     */
    static std::optional<long long> ParseInt(const std::string& str);

    /**
     * @brief Parse "key<sep>value" pairs separated by commas
     *
     * @code
     * ParseKeyValueList("base:2,browser:1", ':');  // {base: 2, browser: 1}
     * @endcode
     *
     * @param str Input list
     * @param separator Separator between key and value
     * @return Parsed map, malformed entries skipped
     */
    static std::map<std::string, std::string> ParseKeyValueList(const std::string& str,
                                                                 char separator);

    /**
     * @brief Remove one layer of matching single or double quotes
     * @param str Input string
     * @return Unquoted string
     */
    static std::string Unquote(const std::string& str);
};

} // namespace utils
} // namespace sandpool

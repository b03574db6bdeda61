/**
 * @file string_utils.hpp
 * @brief String helpers for request parsing and shell command construction
 *
 * Small static utilities used when turning caller input (comma-separated
 * package lists, code read line by line) into execution requests, and when
 * building command lines that are passed to `sh -c` inside the sandbox.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandrun {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto packages = StringUtils::ParsePackageList("numpy, pandas,,numpy");
 * // {"numpy", "pandas"}
 *
 * std::string cmd = "python " + StringUtils::ShellQuote("my script.py");
 * // python 'my script.py'
 * @endcode
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert ASCII letters to lowercase
     * @param str Input string
     * @return Lowercase copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, skipping empty tokens
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens in input order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Parts to join
     * @param delimiter Separator placed between parts
     * @return Joined string (empty if no parts)
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Parse a comma-separated package list
     *
     * Entries are trimmed, empty entries are dropped and repeated names are
     * collapsed to their first occurrence.
     *
     * @param list Raw list, e.g. "numpy, pandas"
     * @return Ordered, de-duplicated package names
     */
    static std::vector<std::string> ParsePackageList(const std::string& list);

    /**
     * @brief Normalize a sequence of package names
     *
     * Same rules as ParsePackageList() applied to an already split sequence.
     */
    static std::vector<std::string> NormalizePackages(const std::vector<std::string>& packages);

    /**
     * @brief Quote a string for POSIX shells
     *
     * Wraps the value in single quotes and escapes embedded single quotes,
     * so the result is always read back by `sh` as exactly one word.
     *
     * @param str Raw value
     * @return Shell-safe single word
     */
    static std::string ShellQuote(const std::string& str);

    /**
     * @brief Truncate string to a maximum length
     * @param str Input string
     * @param max_length Maximum length of the result, suffix included
     * @param suffix Marker appended when truncating
     * @return Original or truncated string
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace sandrun

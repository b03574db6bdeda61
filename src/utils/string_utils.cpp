/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "sandrun/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace sandrun {
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
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
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

// ============================================================================
// PACKAGE LISTS
// ============================================================================

std::vector<std::string> StringUtils::ParsePackageList(const std::string& list) {
    return NormalizePackages(Split(list, ','));
}

std::vector<std::string> StringUtils::NormalizePackages(const std::vector<std::string>& packages) {
    std::vector<std::string> result;
    std::set<std::string> seen;

    for (const auto& raw : packages) {
        std::string name = Trim(raw);
        if (name.empty()) {
            continue;
        }
        if (seen.insert(name).second) {
            result.push_back(name);
        }
    }

    return result;
}

// ============================================================================
// SHELL QUOTING
// ============================================================================
// 'it'"'"'s' style: close the quote, emit a double-quoted ', reopen

std::string StringUtils::ShellQuote(const std::string& str) {
    std::string result = "'";
    for (char c : str) {
        if (c == '\'') {
            result += "'\"'\"'";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

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

} // namespace utils
} // namespace sandrun

#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>

namespace callroute {

namespace utils {

constexpr const char* kWhitespace = " \t\n\r\f\v";

/// Strip leading and trailing whitespace in place
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(kWhitespace));
    str.erase(str.find_last_not_of(kWhitespace) + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lower-case a string in place (ASCII only)
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

/**
 * @brief Lower-case and trim; the canonical form of triggers and utterances
 */
inline std::string normalize_phrase(const std::string& str) {
    std::string result = str;
    normalize(result);
    trim(result);
    return result;
}

inline std::string to_upper_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::toupper(c); });
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(kWhitespace) == std::string::npos;
}

/**
 * @brief Split on runs of whitespace, keeping tokens of at least min_length chars
 */
inline std::vector<std::string> split_words(const std::string& str, size_t min_length = 1) {
    std::vector<std::string> words;
    std::string current;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (current.size() >= min_length && !current.empty()) {
                words.push_back(current);
            }
            current.clear();
        } else {
            current += c;
        }
    }
    if (current.size() >= min_length && !current.empty()) {
        words.push_back(current);
    }
    return words;
}

/**
 * @brief Case-insensitive substring search
 */
inline bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    return normalize_copy(haystack).find(normalize_copy(needle)) != std::string::npos;
}

} // namespace utils

} // namespace callroute

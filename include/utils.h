#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <vector>
#include <cstdint>
#include <cstdio>

namespace carebridge {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
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

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Lowercase, map punctuation (except apostrophes) to spaces, collapse runs of spaces
 *
 * "I can't   take it!!" -> "i can't take it"
 */
inline std::string fold_for_matching(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool last_space = true;
    for (unsigned char c : str) {
        char mapped;
        if (std::isalnum(c) || c == '\'' || c >= 0x80) {
            mapped = static_cast<char>(std::tolower(c));
        } else {
            mapped = ' ';
        }
        if (mapped == ' ') {
            if (!last_space) out += ' ';
            last_space = true;
        } else {
            out += mapped;
            last_space = false;
        }
    }
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

/**
 * @brief Whole-word phrase search on already-normalized text
 *
 * Match must start and end on a non-alphanumeric boundary, so "attack" does
 * not match inside "heartattacks" and "now" does not match "know".
 */
inline bool contains_phrase(const std::string& normalized, const std::string& phrase) {
    if (phrase.empty()) return false;
    size_t pos = normalized.find(phrase);
    while (pos != std::string::npos) {
        bool start_ok = (pos == 0 || !std::isalnum(static_cast<unsigned char>(normalized[pos - 1])));
        size_t end_pos = pos + phrase.length();
        bool end_ok = (end_pos >= normalized.length() ||
                       !std::isalnum(static_cast<unsigned char>(normalized[end_pos])));
        if (start_ok && end_ok) {
            return true;
        }
        pos = normalized.find(phrase, pos + 1);
    }
    return false;
}

/**
 * @brief Return the first phrase from the list found in normalized text, or empty
 */
inline std::string first_phrase_match(const std::string& normalized,
                                      const std::vector<std::string>& phrases) {
    for (const auto& p : phrases) {
        if (contains_phrase(normalized, p)) return p;
    }
    return {};
}

/**
 * @brief 32-bit FNV-1a digest
 */
inline uint32_t fnv1a_32(const std::string& data) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

inline std::string to_hex32(uint32_t value) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", value);
    return std::string(buf);
}

/**
 * @brief Check that text is well-formed UTF-8 with no embedded NUL
 */
inline bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0) return false;
        size_t extra;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0) extra = 3;
        else return false;
        if (extra == 1 && c < 0xC2) return false;  // overlong
        if (extra > 0 && i + extra >= n) return false;  // truncated sequence
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace utils

} // namespace carebridge

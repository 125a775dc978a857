#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace tootbert {
namespace cli {

/**
 * Convert one argument into a bound variable.
 *
 * Returns false, leaving `out` untouched, when the text is not a complete
 * value of the target type ("12abc" is not an int).
 */
inline bool parse_value(const std::string& text, std::string& out) {
    out = text;
    return true;
}

inline bool parse_value(const std::string& text, bool& out) {
    std::string word;
    for (char c : text) {
        word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (word == "1" || word == "true" || word == "yes" || word == "on") {
        out = true;
    } else if (word == "0" || word == "false" || word == "no" || word == "off") {
        out = false;
    } else {
        return false;
    }
    return true;
}

inline bool parse_value(const std::string& text, int& out) {
    if (text.empty()) return false;
    size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    if (used != text.size() || value < INT32_MIN || value > INT32_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

inline bool parse_value(const std::string& text, double& out) {
    if (text.empty()) return false;
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        return false;
    }
    if (used != text.size()) return false;
    out = value;
    return true;
}

/// Placeholder shown after an option name in --help ("--threads INT").
template <typename T>
const char* value_hint() {
    if (std::is_same<T, bool>::value) return "";
    if (std::is_same<T, std::string>::value) return "TEXT";
    if (std::is_integral<T>::value) return "INT";
    if (std::is_floating_point<T>::value) return "FLOAT";
    return "VALUE";
}

}  // namespace cli
}  // namespace tootbert

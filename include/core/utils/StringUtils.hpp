//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace core::utils {

    inline std::string trim(const std::string &value) {
        const char *whitespace = " \t\r\n\f\v";
        auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos) return "";
        auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }

    inline bool isBlank(const std::string &value) {
        return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    }

    inline std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    inline bool equalsIgnoreCase(const std::string &a, const std::string &b) {
        return a.size() == b.size() && toLower(a) == toLower(b);
    }

    /**
     * @brief Case-insensitive (ASCII) prefix test. An empty prefix matches everything.
     */
    inline bool startsWithIgnoreCase(const std::string &value, const std::string &prefix) {
        if (prefix.size() > value.size()) return false;
        return toLower(value.substr(0, prefix.size())) == toLower(prefix);
    }

} // namespace core::utils

/**
 * @file StringUtils.cpp
 * @brief Implementation of text normalization helpers
 */

#include "StringUtils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace locus {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\n\r\f\v";
    size_t begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

std::string to_lower(const std::string& value) {
    std::string result = value;
    for (size_t i = 0; i < result.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(result[i]);
        if (c < 0x80) {
            result[i] = static_cast<char>(std::tolower(c));
            continue;
        }

        // UTF-8 lead byte 0xC3 covers U+00C0..U+00FF. Capitals sit at
        // 0x80..0x9E in the continuation byte (0x97 is the multiplication sign).
        if (c == 0xC3 && i + 1 < result.size()) {
            unsigned char next = static_cast<unsigned char>(result[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                result[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return result;
}

std::string to_upper_ascii(const std::string& value) {
    std::string result = value;
    for (auto& ch : result) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return result;
}

std::string normalize_query(const std::string& value) {
    return to_lower(trim(value));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << int(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace locus

/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "ctfbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <sstream>

namespace ctfbox {
namespace utils {

// ============================================================================
// MANIPULATION
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

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter,
                                            bool keep_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    // getline swallows a trailing empty field
    if (keep_empty && !str.empty() && str.back() == delimiter) {
        tokens.emplace_back();
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::istringstream stream(str);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
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

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// SHELL QUOTING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');

    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }

    quoted.push_back('\'');
    return quoted;
}

std::string StringUtils::ShellJoin(const std::vector<std::string>& args) {
    std::vector<std::string> quoted;
    quoted.reserve(args.size());
    for (const auto& arg : args) {
        quoted.push_back(ShellQuote(arg));
    }
    return Join(quoted, " ");
}

// ============================================================================
// MISC
// ============================================================================

std::string StringUtils::RandomHex(std::size_t length) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 15);

    static const char* digits = "0123456789abcdef";
    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(digits[dis(gen)]);
    }
    return result;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= 3) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - 3) + "...";
}

} // namespace utils
} // namespace ctfbox

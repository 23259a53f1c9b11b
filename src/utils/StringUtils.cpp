#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(),
        [](unsigned char ch) { return !std::isspace(ch); });

    auto end = std::find_if(str.rbegin(), str.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::optional<std::chrono::nanoseconds> StringUtils::parseDuration(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }

    if (text.compare(pos, std::string::npos, "0") == 0) {
        return std::chrono::nanoseconds(0);
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }

    // 단위별 나노초
    static const std::pair<const char*, double> units[] = {
        {"ns", 1.0},
        {"us", 1e3},
        {"\xC2\xB5s", 1e3},  // µs (U+00B5)
        {"\xCE\xBCs", 1e3},  // μs (U+03BC)
        {"ms", 1e6},
        {"s", 1e9},
        {"m", 60e9},
        {"h", 3600e9},
    };

    long double total = 0;
    while (pos < text.size()) {
        size_t numberStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            if (text[pos] == '.') {
                if (seenDot) return std::nullopt;
                seenDot = true;
            } else {
                seenDigit = true;
            }
            ++pos;
        }
        if (!seenDigit) {
            return std::nullopt;
        }
        long double value = std::stold(text.substr(numberStart, pos - numberStart));

        size_t unitStart = pos;
        while (pos < text.size() && text[pos] != '.' &&
               !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::string unit = text.substr(unitStart, pos - unitStart);
        if (unit.empty()) {
            return std::nullopt;
        }

        auto it = std::find_if(std::begin(units), std::end(units),
            [&unit](const auto& entry) { return unit == entry.first; });
        if (it == std::end(units)) {
            return std::nullopt;
        }
        total += value * it->second;
    }

    // 반올림 후 부호가 뒤집히지 않도록 최대값 근처는 거부
    if (total >= static_cast<long double>(std::numeric_limits<std::chrono::nanoseconds::rep>::max())) {
        return std::nullopt;
    }

    auto nanos = static_cast<std::chrono::nanoseconds::rep>(std::llroundl(total));
    return std::chrono::nanoseconds(negative ? -nanos : nanos);
}

std::string StringUtils::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms % 1000 != 0) {
        return std::to_string(ms) + "ms";
    }
    auto seconds = ms / 1000;
    if (seconds != 0 && seconds % 3600 == 0) {
        return std::to_string(seconds / 3600) + "h";
    }
    if (seconds != 0 && seconds % 60 == 0) {
        return std::to_string(seconds / 60) + "m";
    }
    return std::to_string(seconds) + "s";
}

std::optional<bool> StringUtils::parseBool(const std::string& text) {
    std::string value = toLower(trim(text));
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off" || value.empty()) return false;
    return std::nullopt;
}

std::optional<long long> StringUtils::parseNonNegativeInt(const std::string& text) {
    if (text.empty() || text.size() > 18) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    return std::stoll(text);
}

#pragma once

#include <string>
#include <optional>
#include <chrono>

class StringUtils {
public:
    static std::string trim(const std::string& str);

    static std::string toLower(const std::string& str);

    static bool startsWith(const std::string& str, const std::string& prefix) {
        return str.compare(0, prefix.size(), prefix) == 0;
    }

    // "300ms", "1.5s", "1m30s" 형식 (단위: ns, us, µs, ms, s, m, h)
    // 부호 허용, "0" 은 단위 생략 가능. 형식 오류나 범위 초과면 nullopt
    static std::optional<std::chrono::nanoseconds> parseDuration(const std::string& text);

    static std::string formatDuration(std::chrono::milliseconds duration);

    // "true"/"1"/"yes"/"on" -> true, "false"/"0"/"no"/"off"/"" -> false
    static std::optional<bool> parseBool(const std::string& text);

    // 음수가 아닌 10진 정수만 허용
    static std::optional<long long> parseNonNegativeInt(const std::string& text);
};

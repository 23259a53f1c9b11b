#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "curl/OptionSanitizer.hpp"

// 요청 본문(JSON) -> OptionSet
// 값은 문자열 하나 또는 문자열 배열; 문자열 하나는 원소 1개짜리 시퀀스로 정규화
class OptionParser {
public:
    static std::optional<OptionSet> parse(const std::string& body, std::string* error = nullptr);
    static std::optional<OptionSet> fromJson(const nlohmann::json& j, std::string* error = nullptr);

    static std::optional<OptionValue> parseValue(const nlohmann::json& value);

private:
    OptionParser() = delete;
};

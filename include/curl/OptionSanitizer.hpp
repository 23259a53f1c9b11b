#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>

// 하나의 옵션 키에 묶인 값들 (입력 순서 유지)
using OptionValue = std::vector<std::string>;

// std::map: 동일 입력에 대해 인자 순서가 항상 같도록 키 정렬 순회
using OptionSet = std::map<std::string, OptionValue>;

using ArgumentList = std::vector<std::string>;

class UnauthorizedOptionError : public std::runtime_error {
public:
    explicit UnauthorizedOptionError(const std::string& option)
        : std::runtime_error("unauthorized curl option: " + option)
        , option_(option) {}

    const std::string& option() const { return option_; }

private:
    std::string option_;
};

class OptionSanitizer {
public:
    // 허용된 curl 옵션 (대소문자 구분, 시작 후 불변)
    static const std::set<std::string>& allowedOptions();

    static bool isAllowed(const std::string& option);

    // 값이 "" 또는 "true" 이면 키만 단독으로 출력
    static bool isStandaloneValue(const std::string& value);

    // 모든 키를 먼저 검사한 뒤 인자 목록으로 펼친다
    // 허용되지 않은 키가 하나라도 있으면 UnauthorizedOptionError
    static ArgumentList sanitize(const OptionSet& options);

private:
    OptionSanitizer() = delete;
};

#include "curl/OptionSanitizer.hpp"

const std::set<std::string>& OptionSanitizer::allowedOptions() {
    static const std::set<std::string> options = {
        "-k",           // TLS 인증서 검증 생략 (단독)
        "-x",           // 프록시
        "-X",           // HTTP 메서드
        "-d",           // 요청 본문
        "--data",       // 요청 본문 (긴 형식)
        "--location",   // 리다이렉트 추적
        "-H",           // 헤더 (반복 가능)
    };
    return options;
}

bool OptionSanitizer::isAllowed(const std::string& option) {
    return allowedOptions().count(option) > 0;
}

bool OptionSanitizer::isStandaloneValue(const std::string& value) {
    return value.empty() || value == "true";
}

ArgumentList OptionSanitizer::sanitize(const OptionSet& options) {
    // 인자를 만들기 전에 전체 키를 먼저 검사한다
    for (const auto& [option, values] : options) {
        if (!isAllowed(option)) {
            throw UnauthorizedOptionError(option);
        }
    }

    ArgumentList args;
    for (const auto& [option, values] : options) {
        bool standaloneEmitted = false;

        if (values.empty()) {
            args.push_back(option);
            continue;
        }

        for (const auto& value : values) {
            if (isStandaloneValue(value)) {
                if (!standaloneEmitted) {
                    args.push_back(option);
                    standaloneEmitted = true;
                }
                continue;
            }
            args.push_back(option);
            args.push_back(value);
        }
    }

    return args;
}

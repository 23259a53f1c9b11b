#include "curl/OptionParser.hpp"
#include "core/Logger.hpp"

namespace {

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

}  // namespace

std::optional<OptionValue> OptionParser::parseValue(const nlohmann::json& value) {
    if (value.is_string()) {
        return OptionValue{value.get<std::string>()};
    }

    if (!value.is_array() || value.empty()) {
        return std::nullopt;
    }

    OptionValue values;
    values.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::optional<OptionSet> OptionParser::fromJson(const nlohmann::json& j, std::string* error) {
    if (!j.is_object()) {
        setError(error, "request body must be a JSON object");
        return std::nullopt;
    }

    OptionSet options;
    for (const auto& [key, value] : j.items()) {
        auto parsed = parseValue(value);
        if (!parsed) {
            setError(error, fmt::format(
                "value of '{}' must be a string or a non-empty array of strings", key));
            return std::nullopt;
        }
        options.emplace(key, std::move(*parsed));
    }
    return options;
}

std::optional<OptionSet> OptionParser::parse(const std::string& body, std::string* error) {
    try {
        auto j = nlohmann::json::parse(body);
        return fromJson(j, error);
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("JSON parsing error: {}", e.what());
        setError(error, e.what());
        return std::nullopt;
    }
}

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <fstream>
#include <stdexcept>

bool Config::loadConfig(const std::filesystem::path& configPath) {
    if (!std::filesystem::exists(configPath)) {
        LOG_WARNING("Config file not found: {}, using defaults", configPath.string());
        return true;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file: {}", configPath.string());
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", configPath.string(), e.what());
        return false;
    }

    if (!loadFromJson(j)) {
        return false;
    }

    LOG_INFO("Config loaded successfully from: {}", configPath.string());
    return true;
}

bool Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    ServerConfig parsed = serverConfig_;

    try {
        if (auto v = getJsonValue<std::string>(j, "listen_address")) parsed.listenAddress = *v;
        if (auto v = getJsonValue<int>(j, "port")) parsed.port = *v;
        if (auto v = getJsonValue<int>(j, "worker_threads")) parsed.workerThreads = *v;
        if (auto v = getJsonValue<std::string>(j, "curl_path")) parsed.curlPath = *v;
        if (auto v = getDuration(j, "default_timeout")) parsed.defaultTimeout = *v;
        if (auto v = getDuration(j, "max_timeout")) parsed.maxTimeout = *v;
        if (auto v = getJsonValue<size_t>(j, "max_output_bytes")) parsed.maxOutputBytes = *v;
        if (auto v = getJsonValue<bool>(j, "debug_args")) parsed.debugArgs = *v;
        if (auto v = getJsonValue<std::string>(j, "log_level")) parsed.logLevel = *v;
        if (auto v = getJsonValue<std::string>(j, "log_file")) parsed.logFile = *v;
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid config: {}", e.what());
        return false;
    }

    if (parsed.port <= 0 || parsed.port > 65535) {
        LOG_ERROR("Invalid port: {}", parsed.port);
        return false;
    }
    if (parsed.workerThreads <= 0) {
        LOG_ERROR("worker_threads must be positive: {}", parsed.workerThreads);
        return false;
    }
    if (parsed.curlPath.empty()) {
        LOG_ERROR("curl_path must not be empty");
        return false;
    }
    if (parsed.defaultTimeout.count() <= 0 || parsed.maxTimeout < parsed.defaultTimeout) {
        LOG_ERROR("Invalid timeouts: default={}ms, max={}ms",
                  parsed.defaultTimeout.count(), parsed.maxTimeout.count());
        return false;
    }
    if (!Logger::parseLevel(parsed.logLevel)) {
        LOG_ERROR("Invalid log_level: {}", parsed.logLevel);
        return false;
    }

    serverConfig_ = parsed;
    return true;
}

nlohmann::json Config::toJson() const {
    return {
        {"listen_address", serverConfig_.listenAddress},
        {"port", serverConfig_.port},
        {"worker_threads", serverConfig_.workerThreads},
        {"curl_path", serverConfig_.curlPath},
        {"default_timeout", StringUtils::formatDuration(serverConfig_.defaultTimeout)},
        {"max_timeout", StringUtils::formatDuration(serverConfig_.maxTimeout)},
        {"max_output_bytes", serverConfig_.maxOutputBytes},
        {"debug_args", serverConfig_.debugArgs},
        {"log_level", serverConfig_.logLevel},
        {"log_file", serverConfig_.logFile}
    };
}

template<typename T>
std::optional<T> Config::getJsonValue(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    try {
        return j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("'{}': {}", key, e.what()));
    }
}

std::optional<std::chrono::milliseconds> Config::getDuration(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }

    const auto& value = j.at(key);
    // 숫자는 밀리초로 해석
    if (value.is_number_integer()) {
        return std::chrono::milliseconds(value.get<long long>());
    }
    if (value.is_string()) {
        auto parsed = StringUtils::parseDuration(value.get<std::string>());
        if (parsed) {
            return std::chrono::ceil<std::chrono::milliseconds>(*parsed);
        }
    }
    throw std::runtime_error(fmt::format("'{}': invalid duration", key));
}

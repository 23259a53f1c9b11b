#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

class Config {
public:
    struct ServerConfig {
        // HTTP 서버
        std::string listenAddress = "0.0.0.0";
        int port = 8080;
        int workerThreads = 8;

        // curl 실행
        std::string curlPath = "curl";
        std::chrono::milliseconds defaultTimeout{30000};
        std::chrono::milliseconds maxTimeout{300000};
        size_t maxOutputBytes = 16 * 1024 * 1024;
        bool debugArgs = false;

        // 로깅
        std::string logLevel = "info";
        std::string logFile;
    };

    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // 파일이 없으면 기본값 사용 (경고만), 형식 오류면 false
    bool loadConfig(const std::filesystem::path& configPath);
    bool loadFromJson(const nlohmann::json& j);
    void reset() { serverConfig_ = ServerConfig{}; }

    const ServerConfig& getServerConfig() const { return serverConfig_; }
    ServerConfig& getServerConfig() { return serverConfig_; }

    nlohmann::json toJson() const;

private:
    Config() = default;

    ServerConfig serverConfig_;

    template<typename T>
    std::optional<T> getJsonValue(const nlohmann::json& j, const std::string& key);
    std::optional<std::chrono::milliseconds> getDuration(const nlohmann::json& j, const std::string& key);
};

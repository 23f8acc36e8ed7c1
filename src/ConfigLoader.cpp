#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include <cstdlib>
#include <fstream>

namespace AioClient {

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        AIO_LOG_WARNING("Config file not found: " + filename);
        return false;
    }
    
    try {
        json j;
        file >> j;
        return loadFromJson(j);
    } catch (const std::exception& e) {
        AIO_LOG_ERROR("Error parsing config file " + filename + ": " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromJson(const json& j) {
    if (!j.is_object()) {
        AIO_LOG_ERROR("Configuration must be a JSON object");
        return false;
    }
    
    try {
        if (j.contains("username")) {
            config_.client.username = j["username"].get<std::string>();
        }
        if (j.contains("key")) {
            config_.client.key = j["key"].get<std::string>();
        }
        if (j.contains("baseUrl")) {
            config_.client.baseUrl = j["baseUrl"].get<std::string>();
        }
        if (j.contains("apiVersion")) {
            config_.client.apiVersion = j["apiVersion"].get<std::string>();
        }
        if (j.contains("httpConfig")) {
            auto httpCfg = j["httpConfig"];
            if (httpCfg.contains("timeoutMs")) {
                config_.httpConfig.timeoutMs = httpCfg["timeoutMs"].get<int>();
            }
            if (httpCfg.contains("connectTimeoutMs")) {
                config_.httpConfig.connectTimeoutMs = httpCfg["connectTimeoutMs"].get<int>();
            }
            if (httpCfg.contains("userAgent")) {
                config_.httpConfig.userAgent = httpCfg["userAgent"].get<std::string>();
            }
            if (httpCfg.contains("verifyPeer")) {
                config_.httpConfig.verifyPeer = httpCfg["verifyPeer"].get<bool>();
            }
        }
        if (j.contains("logFile")) {
            config_.logFile = j["logFile"].get<std::string>();
        }
        if (j.contains("logLevel")) {
            config_.logLevel = j["logLevel"].get<std::string>();
        }
        if (j.contains("consoleLog")) {
            config_.consoleLog = j["consoleLog"].get<bool>();
        }
    } catch (const json::exception& e) {
        AIO_LOG_ERROR("Invalid configuration value: " + std::string(e.what()));
        return false;
    }
    
    AIO_LOG_DEBUG("Client configuration loaded for user " + config_.client.username);
    return true;
}

void ConfigLoader::applyEnvironment() {
    if (const char* username = std::getenv("AIO_USERNAME")) {
        config_.client.username = username;
    }
    if (const char* key = std::getenv("AIO_KEY")) {
        config_.client.key = key;
    }
}

AppConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::setDefaults() {
    config_.client.username = "";
    config_.client.key = "";
    config_.client.baseUrl = kDefaultBaseUrl;
    config_.client.apiVersion = kDefaultApiVersion;
    config_.httpConfig.timeoutMs = 5000;
    config_.httpConfig.connectTimeoutMs = 3000;
    config_.httpConfig.userAgent = "ur-aio-client";
    config_.httpConfig.verifyPeer = true;
    config_.logFile = "";
    config_.logLevel = "INFO";
    config_.consoleLog = true;
}

} // namespace AioClient

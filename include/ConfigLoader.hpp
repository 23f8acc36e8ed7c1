#pragma once
#include "Client.hpp"
#include "CurlTransport.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace AioClient {

struct AppConfig {
    ClientConfig client;
    HttpConfig httpConfig;
    std::string logFile;
    std::string logLevel;
    bool consoleLog;
};

class ConfigLoader {
public:
    ConfigLoader();
    bool loadFromFile(const std::string& filename);
    bool loadFromJson(const json& j);
    // AIO_USERNAME / AIO_KEY take precedence over the file
    void applyEnvironment();
    AppConfig getConfig() const;
    
private:
    AppConfig config_;
    void setDefaults();
};

} // namespace AioClient

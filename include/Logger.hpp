#pragma once
#include <atomic>
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>

namespace AioClient {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    bool setLogLevel(const std::string& levelName);
    LogLevel getLogLevel() const;
    void setLogFile(const std::string& filename);
    void setConsoleOutput(bool enabled);
    
    static bool parseLevel(const std::string& levelName, LogLevel& level);
    
private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    
    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_;
    bool consoleOutput_;
    std::ofstream logFile_;
};

} // namespace AioClient

#define AIO_LOG_DEBUG(msg) AioClient::Logger::getInstance().log(AioClient::LogLevel::DEBUG, msg)
#define AIO_LOG_INFO(msg) AioClient::Logger::getInstance().log(AioClient::LogLevel::INFO, msg)
#define AIO_LOG_WARNING(msg) AioClient::Logger::getInstance().log(AioClient::LogLevel::WARNING, msg)
#define AIO_LOG_ERROR(msg) AioClient::Logger::getInstance().log(AioClient::LogLevel::ERROR, msg)

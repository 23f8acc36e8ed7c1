#pragma once
#include <stdexcept>
#include <string>

namespace AioClient {

class AioError : public std::runtime_error {
public:
    explicit AioError(const std::string& message) : std::runtime_error(message) {}
};

// Missing credentials, missing transport or an unusable configuration file
class ConfigurationError : public AioError {
public:
    explicit ConfigurationError(const std::string& message) : AioError(message) {}
};

// The transport failed before a complete response was available. Never retried.
class TransportError : public AioError {
public:
    explicit TransportError(const std::string& message) : AioError(message) {}
};

// The server answered with a status outside 2xx
class APIError : public AioError {
public:
    APIError(int statusCode, const std::string& body)
        : AioError("HTTP " + std::to_string(statusCode) + ": " + body),
          statusCode_(statusCode), body_(body) {}
    
    int statusCode() const { return statusCode_; }
    const std::string& body() const { return body_; }
    
private:
    int statusCode_;
    std::string body_;
};

class DecodingError : public AioError {
public:
    DecodingError(const std::string& message, const std::string& body)
        : AioError(message), body_(body) {}
    
    const std::string& body() const { return body_; }
    
private:
    std::string body_;
};

} // namespace AioClient

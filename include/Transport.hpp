#pragma once
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace AioClient {

using json = nlohmann::json;
using Headers = std::map<std::string, std::string>;

/**
 * One HTTP response handed back by a Transport.
 * The client closes every response it receives exactly once, on success and on error.
 */
class Response {
public:
    virtual ~Response() = default;
    
    virtual int statusCode() const = 0;
    
    // Raw body. May throw if the body cannot be read.
    virtual std::string text() = 0;
    
    // Releases the underlying connection/buffer. Must be safe to call more than once.
    virtual void close() noexcept = 0;
    
    // Parses text() as JSON. An empty body yields null. Throws DecodingError.
    nlohmann::json json();
    
    bool isSuccess() const { return statusCode() >= 200 && statusCode() < 300; }
};

/**
 * Network collaborator performing the actual HTTP exchange.
 * Connection management, timeouts and TLS live behind this interface.
 * Implementations report failures by throwing; TransportError is preferred.
 */
class Transport {
public:
    virtual ~Transport() = default;
    
    virtual std::unique_ptr<Response> get(const std::string& url, const Headers& headers) = 0;
    virtual std::unique_ptr<Response> post(const std::string& url, const std::string& body,
                                           const Headers& headers) = 0;
    virtual std::unique_ptr<Response> del(const std::string& url, const Headers& headers) = 0;
};

} // namespace AioClient

#pragma once

#include "Transport.hpp"
#include <memory>
#include <string>

namespace AioClient {

struct HttpConfig {
    int timeoutMs = 5000;
    int connectTimeoutMs = 3000;
    std::string userAgent = "ur-aio-client";
    bool verifyPeer = true;
};

// Fully buffered response; the body is read before perform() returns
class CurlResponse : public Response {
public:
    CurlResponse(int statusCode, std::string body);
    
    int statusCode() const override;
    std::string text() override;
    void close() noexcept override;
    
    bool isClosed() const { return closed_; }
    
private:
    int statusCode_;
    std::string body_;
    bool closed_;
};

/**
 * Transport backed by a single libcurl easy handle.
 * Requests are serialized on an internal mutex, so one instance may be
 * shared between threads. curl_global_init() is the caller's responsibility.
 */
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const HttpConfig& config);
    ~CurlTransport() override;
    
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;
    
    std::unique_ptr<Response> get(const std::string& url, const Headers& headers) override;
    std::unique_ptr<Response> post(const std::string& url, const std::string& body,
                                   const Headers& headers) override;
    std::unique_ptr<Response> del(const std::string& url, const Headers& headers) override;
    
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
    HttpConfig config_;
    
    std::unique_ptr<Response> perform(const std::string& method, const std::string& url,
                                      const std::string* body, const Headers& headers);
};

} // namespace AioClient

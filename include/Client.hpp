#pragma once
#include "DataPointSerializer.hpp"
#include "Transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace AioClient {

extern const char* const kDefaultBaseUrl;
extern const char* const kDefaultApiVersion;

struct ClientConfig {
    std::string username;
    std::string key;
    std::string baseUrl = kDefaultBaseUrl;
    std::string apiVersion = kDefaultApiVersion;
};

/**
 * REST client for Adafruit IO feeds, data points and groups.
 *
 * Every call is one blocking round trip through the injected transport.
 * The client keeps no mutable state; sharing an instance between threads
 * is safe only if the transport is.
 *
 * Errors: ConfigurationError (construction), TransportError, APIError,
 * DecodingError. Nothing is retried.
 */
class Client {
public:
    Client(const std::string& username, const std::string& key,
           std::shared_ptr<Transport> transport,
           const std::string& apiVersion = kDefaultApiVersion,
           const std::string& baseUrl = kDefaultBaseUrl);
    Client(const ClientConfig& config, std::shared_ptr<Transport> transport);
    
    // <baseUrl>/<apiVersion>/<username>/<path>, no escaping applied
    std::string composePath(const std::string& path) const;
    
    // Data
    json sendData(const std::string& feedKey, const json& value,
                  std::optional<double> lat = std::nullopt,
                  std::optional<double> lon = std::nullopt,
                  std::optional<double> ele = std::nullopt,
                  std::optional<std::string> createdAt = std::nullopt);
    json sendDataPoint(const std::string& feedKey, const DataPoint& point);
    json receiveData(const std::string& feedKey);
    DataPoint receiveDataPoint(const std::string& feedKey);
    json deleteData(const std::string& feedKey, const std::string& dataId);
    
    // Feeds
    json getFeed(const std::string& feedKey);
    json getAllFeeds();
    json deleteFeed(const std::string& feedKey);
    
    // Groups
    json getAllGroups();
    json createNewGroup(const std::string& name, const std::string& description);
    
    const std::string& username() const { return username_; }
    const std::string& apiVersion() const { return apiVersion_; }
    const std::string& baseUrl() const { return baseUrl_; }
    
private:
    json get(const std::string& url);
    json post(const std::string& url, const std::string& body);
    json del(const std::string& url);
    
    template <typename Call>
    json dispatch(const char* method, const std::string& url, Call&& call);
    
    Headers authHeaders() const;
    Headers writeHeaders() const;
    static void requireSegment(const std::string& value, const char* what);
    
    const std::string username_;
    const std::string key_;
    const std::string apiVersion_;
    const std::string baseUrl_;
    const std::shared_ptr<Transport> transport_;
};

} // namespace AioClient

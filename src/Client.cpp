#include "Client.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <utility>

namespace AioClient {

const char* const kDefaultBaseUrl = "https://io.adafruit.com/api";
const char* const kDefaultApiVersion = "v2";

namespace {

const char* const kAuthHeader = "X-AIO-KEY";
const char* const kContentTypeHeader = "Content-Type";
const char* const kJsonContentType = "application/json";

// Closes the response when the request scope ends, whichever way it ends
class ResponseCloser {
public:
    explicit ResponseCloser(Response& response) : response_(response) {}
    ~ResponseCloser() {
        response_.close();
    }
    
    ResponseCloser(const ResponseCloser&) = delete;
    ResponseCloser& operator=(const ResponseCloser&) = delete;
    
private:
    Response& response_;
};

std::string trimTrailingSlashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string readBody(Response& response, const std::string& request) {
    try {
        return response.text();
    } catch (const AioError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransportError(request + ": failed to read response body: " + e.what());
    }
}

} // namespace

Client::Client(const std::string& username, const std::string& key,
               std::shared_ptr<Transport> transport,
               const std::string& apiVersion, const std::string& baseUrl)
    : username_(username),
      key_(key),
      apiVersion_(apiVersion),
      baseUrl_(trimTrailingSlashes(baseUrl)),
      transport_(std::move(transport)) {
    if (!transport_) {
        throw ConfigurationError("A transport is required");
    }
    if (username_.empty()) {
        throw ConfigurationError("Username must not be empty");
    }
    if (key_.empty()) {
        throw ConfigurationError("API key must not be empty");
    }
    if (apiVersion_.empty()) {
        throw ConfigurationError("API version must not be empty");
    }
    if (baseUrl_.empty()) {
        throw ConfigurationError("Base URL must not be empty");
    }
    
    AIO_LOG_DEBUG("Client created for user " + username_ + " at " + baseUrl_ + "/" + apiVersion_);
}

Client::Client(const ClientConfig& config, std::shared_ptr<Transport> transport)
    : Client(config.username, config.key, std::move(transport), config.apiVersion, config.baseUrl) {}

std::string Client::composePath(const std::string& path) const {
    return baseUrl_ + "/" + apiVersion_ + "/" + username_ + "/" + path;
}

json Client::sendData(const std::string& feedKey, const json& value,
                      std::optional<double> lat, std::optional<double> lon,
                      std::optional<double> ele, std::optional<std::string> createdAt) {
    DataPoint point(value);
    point.lat = lat;
    point.lon = lon;
    point.ele = ele;
    point.createdAt = std::move(createdAt);
    return sendDataPoint(feedKey, point);
}

json Client::sendDataPoint(const std::string& feedKey, const DataPoint& point) {
    requireSegment(feedKey, "feed key");
    DataPointSerializer::validateDataPoint(point);
    std::string packet = DataPointSerializer::serializeDataPoint(point).dump();
    return post(composePath("feeds/" + feedKey + "/data"), packet);
}

json Client::receiveData(const std::string& feedKey) {
    requireSegment(feedKey, "feed key");
    return get(composePath("feeds/" + feedKey + "/data/last"));
}

DataPoint Client::receiveDataPoint(const std::string& feedKey) {
    return DataPointSerializer::deserializeDataPoint(receiveData(feedKey));
}

json Client::deleteData(const std::string& feedKey, const std::string& dataId) {
    requireSegment(feedKey, "feed key");
    requireSegment(dataId, "data id");
    return del(composePath("feeds/" + feedKey + "/data/" + dataId));
}

json Client::getFeed(const std::string& feedKey) {
    requireSegment(feedKey, "feed key");
    return get(composePath("feeds/" + feedKey));
}

json Client::getAllFeeds() {
    return get(composePath("feeds"));
}

json Client::deleteFeed(const std::string& feedKey) {
    requireSegment(feedKey, "feed key");
    return del(composePath("feeds/" + feedKey));
}

json Client::getAllGroups() {
    return get(composePath("groups"));
}

json Client::createNewGroup(const std::string& name, const std::string& description) {
    GroupRequest group{name, description};
    std::string packet = DataPointSerializer::serializeGroupRequest(group).dump();
    return post(composePath("groups"), packet);
}

json Client::get(const std::string& url) {
    Headers headers = authHeaders();
    return dispatch("GET", url, [&]() { return transport_->get(url, headers); });
}

json Client::post(const std::string& url, const std::string& body) {
    Headers headers = writeHeaders();
    AIO_LOG_DEBUG("  Payload: " + body);
    return dispatch("POST", url, [&]() { return transport_->post(url, body, headers); });
}

json Client::del(const std::string& url) {
    Headers headers = authHeaders();
    return dispatch("DELETE", url, [&]() { return transport_->del(url, headers); });
}

template <typename Call>
json Client::dispatch(const char* method, const std::string& url, Call&& call) {
    const std::string request = std::string(method) + " " + url;
    AIO_LOG_DEBUG("HTTP " + request);
    
    std::unique_ptr<Response> response;
    try {
        response = call();
    } catch (const AioError& e) {
        AIO_LOG_ERROR(request + " failed: " + e.what());
        throw;
    } catch (const std::exception& e) {
        AIO_LOG_ERROR(request + " failed: " + e.what());
        throw TransportError(request + " failed: " + e.what());
    }
    
    if (!response) {
        AIO_LOG_ERROR(request + " failed: transport returned no response");
        throw TransportError(request + " failed: transport returned no response");
    }
    
    ResponseCloser closer(*response);
    
    const int status = response->statusCode();
    AIO_LOG_DEBUG("  Status: " + std::to_string(status));
    
    if (!response->isSuccess()) {
        std::string body = readBody(*response, request);
        AIO_LOG_ERROR(request + " returned HTTP " + std::to_string(status));
        throw APIError(status, body);
    }
    
    try {
        return response->json();
    } catch (const DecodingError& e) {
        AIO_LOG_ERROR(request + ": " + e.what());
        throw;
    } catch (const AioError&) {
        throw;
    } catch (const std::exception& e) {
        AIO_LOG_ERROR(request + ": failed to read response body: " + e.what());
        throw TransportError(request + ": failed to read response body: " + e.what());
    }
}

Headers Client::authHeaders() const {
    return Headers{{kAuthHeader, key_}};
}

Headers Client::writeHeaders() const {
    Headers headers = authHeaders();
    headers[kContentTypeHeader] = kJsonContentType;
    return headers;
}

void Client::requireSegment(const std::string& value, const char* what) {
    if (value.empty()) {
        throw std::invalid_argument(std::string(what) + " must not be empty");
    }
}

} // namespace AioClient

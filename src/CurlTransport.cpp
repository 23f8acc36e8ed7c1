#include "CurlTransport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <curl/curl.h>
#include <mutex>
#include <utility>

namespace AioClient {

namespace {

// Callback for curl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Frees the header list on every exit from perform()
struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

} // namespace

struct CurlTransport::Impl {
    CURL* curl;
    std::mutex mutex;
    
    Impl() : curl(nullptr) {
        curl = curl_easy_init();
    }
    
    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

CurlResponse::CurlResponse(int statusCode, std::string body)
    : statusCode_(statusCode), body_(std::move(body)), closed_(false) {}

int CurlResponse::statusCode() const {
    return statusCode_;
}

std::string CurlResponse::text() {
    if (closed_) {
        throw TransportError("Response already closed");
    }
    return body_;
}

void CurlResponse::close() noexcept {
    if (closed_) return;
    closed_ = true;
    std::string().swap(body_);
}

CurlTransport::CurlTransport(const HttpConfig& config)
    : pImpl(std::make_unique<Impl>()), config_(config) {
    if (!pImpl->curl) {
        throw TransportError("Failed to initialize CURL");
    }
}

CurlTransport::~CurlTransport() = default;

std::unique_ptr<Response> CurlTransport::get(const std::string& url, const Headers& headers) {
    return perform("GET", url, nullptr, headers);
}

std::unique_ptr<Response> CurlTransport::post(const std::string& url, const std::string& body,
                                              const Headers& headers) {
    return perform("POST", url, &body, headers);
}

std::unique_ptr<Response> CurlTransport::del(const std::string& url, const Headers& headers) {
    return perform("DELETE", url, nullptr, headers);
}

std::unique_ptr<Response> CurlTransport::perform(const std::string& method, const std::string& url,
                                                 const std::string* body, const Headers& headers) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    CURL* curl = pImpl->curl;
    curl_easy_reset(curl);
    
    HeaderList headerList;
    for (const auto& header : headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(headerList.list, line.c_str());
        if (!appended) {
            throw TransportError("Failed to build request headers");
        }
        headerList.list = appended;
    }
    
    std::string responseBody;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connectTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verifyPeer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        AIO_LOG_DEBUG("[CurlTransport] " + method + " " + url + ": " + curl_easy_strerror(res));
        throw TransportError(method + " " + url + ": " + curl_easy_strerror(res));
    }
    
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    
    return std::make_unique<CurlResponse>(static_cast<int>(httpCode), std::move(responseBody));
}

} // namespace AioClient

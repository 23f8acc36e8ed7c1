#include "Transport.hpp"
#include "Errors.hpp"

namespace AioClient {

nlohmann::json Response::json() {
    std::string body = text();
    if (body.empty()) {
        return nullptr;
    }
    
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodingError("Response body is not valid JSON: " + std::string(e.what()), body);
    }
}

} // namespace AioClient

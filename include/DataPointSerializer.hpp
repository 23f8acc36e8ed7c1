#ifndef AIO_DATA_POINT_SERIALIZER_HPP
#define AIO_DATA_POINT_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace AioClient {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

// One telemetry sample. value is a JSON scalar or string.
struct DataPoint {
    json value;
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<double> ele;
    std::optional<std::string> createdAt;
    
    // Only set on points read back from the server
    std::optional<std::string> id;
    json raw;
    
    DataPoint() : value(nullptr), raw(nullptr) {}
    explicit DataPoint(json v) : value(std::move(v)), raw(nullptr) {}
};

struct GroupRequest {
    std::string name;
    std::string description;
};

class DataPointSerializer {
public:
    // Keys are emitted as value, lat, lon, ele, created_at; absent fields as null
    static ordered_json serializeDataPoint(const DataPoint& point);
    static DataPoint deserializeDataPoint(const json& j);
    
    // Throws std::invalid_argument for object/array/null values or non-finite coordinates
    static void validateDataPoint(const DataPoint& point);
    
    // Locale-independent; returns nullopt unless text is a finite JSON number
    static std::optional<double> parseDecimal(const std::string& text);
    
    static ordered_json serializeGroupRequest(const GroupRequest& group);
};

} // namespace AioClient

#endif // AIO_DATA_POINT_SERIALIZER_HPP

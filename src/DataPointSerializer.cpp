#include "../include/DataPointSerializer.hpp"
#include "../include/Errors.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace AioClient {

namespace {

template <typename T>
ordered_json optionalToJson(const std::optional<T>& field) {
    if (field) {
        return ordered_json(*field);
    }
    return ordered_json(nullptr);
}

// The service reports coordinates either as numbers or as numeric strings
std::optional<double> numberField(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const json& field = j[key];
    if (field.is_number()) {
        double value = field.get<double>();
        if (std::isfinite(value)) {
            return value;
        }
    }
    if (field.is_string()) {
        std::optional<double> parsed = DataPointSerializer::parseDecimal(field.get<std::string>());
        if (parsed) {
            return parsed;
        }
    }
    throw DecodingError(std::string("Data point field '") + key + "' is not numeric", j.dump());
}

std::optional<std::string> stringField(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const json& field = j[key];
    if (field.is_string()) {
        return field.get<std::string>();
    }
    return field.dump();
}

void requireFinite(const std::optional<double>& field, const char* key) {
    if (field && !std::isfinite(*field)) {
        throw std::invalid_argument(std::string("Data point field '") + key + "' must be finite");
    }
}

} // namespace

std::optional<double> DataPointSerializer::parseDecimal(const std::string& text) {
    // JSON number grammar only: no hex, inf/nan, or surrounding whitespace
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())) ||
        std::isspace(static_cast<unsigned char>(text.back()))) {
        return std::nullopt;
    }
    
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_number()) {
        return std::nullopt;
    }
    double value = parsed.get<double>();
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

void DataPointSerializer::validateDataPoint(const DataPoint& point) {
    if (!point.value.is_primitive() || point.value.is_null()) {
        throw std::invalid_argument("Data point value must be a number, boolean or string");
    }
    requireFinite(point.lat, "lat");
    requireFinite(point.lon, "lon");
    requireFinite(point.ele, "ele");
}

ordered_json DataPointSerializer::serializeDataPoint(const DataPoint& point) {
    ordered_json j;
    j["value"] = ordered_json::parse(point.value.dump());
    j["lat"] = optionalToJson(point.lat);
    j["lon"] = optionalToJson(point.lon);
    j["ele"] = optionalToJson(point.ele);
    j["created_at"] = optionalToJson(point.createdAt);
    return j;
}

DataPoint DataPointSerializer::deserializeDataPoint(const json& j) {
    if (!j.is_object()) {
        throw DecodingError("Data point is not a JSON object", j.dump());
    }
    
    DataPoint point;
    point.value = j.contains("value") ? j["value"] : json(nullptr);
    point.lat = numberField(j, "lat");
    point.lon = numberField(j, "lon");
    point.ele = numberField(j, "ele");
    point.createdAt = stringField(j, "created_at");
    point.id = stringField(j, "id");
    point.raw = j;
    return point;
}

ordered_json DataPointSerializer::serializeGroupRequest(const GroupRequest& group) {
    ordered_json j;
    j["name"] = group.name;
    j["description"] = group.description;
    return j;
}

} // namespace AioClient

#include <iostream>
#include <string>

#include "DataPointSerializer.hpp"
#include "Errors.hpp"

using namespace AioClient;

int main() {
    std::cout << "=== Testing Data Point Serializer ===" << std::endl;
    int failures = 0;
    auto expect = [&failures](bool ok, const std::string& what) {
        std::cout << (ok ? "✓ " : "✗ ") << what << std::endl;
        if (!ok) failures++;
    };
    
    // 1. Serialization
    std::cout << "\n1. Serialization:" << std::endl;
    
    DataPoint bare(json("on"));
    expect(DataPointSerializer::serializeDataPoint(bare).dump() ==
               R"({"value":"on","lat":null,"lon":null,"ele":null,"created_at":null})",
           "bare point keeps every key, in wire order");
    
    DataPoint full(json(true));
    full.lat = 51.5;
    full.lon = -0.125;
    full.ele = 35.0;
    full.createdAt = "2024-05-01T12:00:00Z";
    full.id = "ignored-on-write";
    expect(DataPointSerializer::serializeDataPoint(full).dump() ==
               R"({"value":true,"lat":51.5,"lon":-0.125,"ele":35.0,"created_at":"2024-05-01T12:00:00Z"})",
           "full point serialized, server id not sent");
    
    GroupRequest group{"Garden", "Soil sensors"};
    expect(DataPointSerializer::serializeGroupRequest(group).dump() ==
               R"({"name":"Garden","description":"Soil sensors"})",
           "group request serialized");
    
    // 2. Deserialization
    std::cout << "\n2. Deserialization:" << std::endl;
    
    json received = json::parse(R"({
        "id": "0F1XYZ",
        "value": "18.25",
        "feed_key": "soil",
        "lat": 51.5,
        "lon": "-0.125",
        "ele": null,
        "created_at": "2024-05-01T12:00:00Z",
        "created_epoch": 1714564800
    })");
    DataPoint point = DataPointSerializer::deserializeDataPoint(received);
    expect(point.value == "18.25", "value kept as sent by server");
    expect(point.lat && *point.lat == 51.5, "numeric latitude");
    expect(point.lon && *point.lon == -0.125, "string longitude converted");
    expect(!point.ele, "null elevation empty");
    expect(point.createdAt && *point.createdAt == "2024-05-01T12:00:00Z", "created_at");
    expect(point.id && *point.id == "0F1XYZ", "server id");
    expect(point.raw == received, "raw document preserved");
    
    json numericId = json::parse(R"({"id": 77, "value": 3})");
    DataPoint legacy = DataPointSerializer::deserializeDataPoint(numericId);
    expect(legacy.id && *legacy.id == "77", "numeric id rendered as text");
    expect(!legacy.lat && !legacy.lon && !legacy.createdAt, "missing fields empty");
    
    // 3. Malformed input
    std::cout << "\n3. Malformed input:" << std::endl;
    
    bool rejected = false;
    try {
        DataPointSerializer::deserializeDataPoint(json::parse(R"({"value": 1, "lat": "north"})"));
    } catch (const DecodingError& e) {
        rejected = true;
        std::cout << "  " << e.what() << std::endl;
    }
    expect(rejected, "non-numeric latitude rejected");
    
    rejected = false;
    try {
        DataPointSerializer::deserializeDataPoint(json::parse(R"({"value": 1, "lon": "0x10"})"));
    } catch (const DecodingError&) {
        rejected = true;
    }
    expect(rejected, "hex longitude rejected");
    
    rejected = false;
    try {
        DataPointSerializer::deserializeDataPoint(json::parse(R"({"value": 1, "ele": "inf"})"));
    } catch (const DecodingError&) {
        rejected = true;
    }
    expect(rejected, "infinite elevation rejected");
    
    expect(DataPointSerializer::parseDecimal("-0.125") == -0.125, "strict decimal parse");
    expect(!DataPointSerializer::parseDecimal("nan") && !DataPointSerializer::parseDecimal(" 1") &&
               !DataPointSerializer::parseDecimal("1e999"),
           "nan, padded and overflowing decimals refused");
    
    rejected = false;
    try {
        DataPointSerializer::deserializeDataPoint(json("plain"));
    } catch (const DecodingError&) {
        rejected = true;
    }
    expect(rejected, "non-object rejected");
    
    std::cout << "\n=== " << (failures == 0 ? "All Tests Passed" : "Failures: " + std::to_string(failures))
              << " ===" << std::endl;
    return failures == 0 ? 0 : 1;
}

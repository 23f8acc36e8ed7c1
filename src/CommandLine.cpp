#include "CommandLine.hpp"
#include <stdexcept>

namespace AioClient {

json CommandLine::parseValue(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
        return parsed;
    }
    return json(text);
}

double CommandLine::parseNumber(const std::string& option, const std::string& text) {
    std::optional<double> value = DataPointSerializer::parseDecimal(text);
    if (!value) {
        throw std::invalid_argument(option + " expects a number, got '" + text + "'");
    }
    return *value;
}

SendArguments CommandLine::parseSendArguments(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    SendArguments result;
    
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool isOption = arg == "--lat" || arg == "--lon" || arg == "--ele" || arg == "--created-at";
        if (!isOption) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(arg + " requires a value");
        }
        const std::string& value = args[++i];
        if (arg == "--lat") {
            result.point.lat = parseNumber(arg, value);
        } else if (arg == "--lon") {
            result.point.lon = parseNumber(arg, value);
        } else if (arg == "--ele") {
            result.point.ele = parseNumber(arg, value);
        } else {
            result.point.createdAt = value;
        }
    }
    
    if (positional.size() != 2) {
        throw std::invalid_argument("send expects FEED VALUE");
    }
    result.feedKey = positional[0];
    result.point.value = parseValue(positional[1]);
    return result;
}

} // namespace AioClient

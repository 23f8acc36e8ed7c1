#pragma once
#include "DataPointSerializer.hpp"
#include <string>
#include <vector>

namespace AioClient {

struct SendArguments {
    std::string feedKey;
    DataPoint point;
};

class CommandLine {
public:
    // Finite numbers and booleans are sent as such, anything else as a string
    static json parseValue(const std::string& text);
    
    // Throws std::invalid_argument naming the option when text is not a finite number
    static double parseNumber(const std::string& option, const std::string& text);
    
    // FEED VALUE [--lat N] [--lon N] [--ele N] [--created-at TS], options in any position
    static SendArguments parseSendArguments(const std::vector<std::string>& args);
};

} // namespace AioClient

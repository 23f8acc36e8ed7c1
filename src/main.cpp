#include "Client.hpp"
#include "CommandLine.hpp"
#include "ConfigLoader.hpp"
#include "CurlTransport.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace AioClient;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_TRANSPORT = 2,
    EXIT_API = 3,
    EXIT_DECODING = 4
};

// Releases libcurl global state however main() returns
struct CurlGlobal {
    CurlGlobal() : ok(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok) curl_global_cleanup();
    }
    bool ok;
};

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS] COMMAND [ARGS]\n\n";
    std::cout << "Adafruit IO REST client\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE                   Path to client configuration JSON file\n";
    std::cout << "  -v, --verbose                       Log requests at DEBUG level\n";
    std::cout << "  -h, --help                          Display this help message and exit\n\n";
    std::cout << "Commands:\n";
    std::cout << "  send FEED VALUE [--lat N] [--lon N] [--ele N] [--created-at TS]\n";
    std::cout << "  receive FEED                        Most recent data point of a feed\n";
    std::cout << "  delete-data FEED ID                 Delete one data point\n";
    std::cout << "  feed KEY                            Show one feed\n";
    std::cout << "  feeds                               List all feeds\n";
    std::cout << "  delete-feed KEY                     Delete a feed\n";
    std::cout << "  groups                              List all groups\n";
    std::cout << "  create-group NAME DESCRIPTION       Create a group\n\n";
    std::cout << "Environment:\n";
    std::cout << "  AIO_USERNAME, AIO_KEY override the username and key from the config file.\n";
}

bool expectArgs(const std::string& command, const std::vector<std::string>& args, size_t count) {
    if (args.size() != count) {
        std::cerr << "Error: " << command << " expects " << count << " argument(s)" << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    bool verbose = false;
    std::string command;
    std::vector<std::string> commandArgs;
    
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        
        if (!command.empty()) {
            commandArgs.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return EXIT_OK;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return EXIT_USAGE;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            printHelp(argv[0]);
            return EXIT_USAGE;
        } else {
            command = arg;
        }
    }
    
    if (command.empty()) {
        printHelp(argv[0]);
        return EXIT_USAGE;
    }
    
    ConfigLoader loader;
    if (!configFile.empty() && !loader.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load config file: " << configFile << std::endl;
        return EXIT_USAGE;
    }
    loader.applyEnvironment();
    AppConfig config = loader.getConfig();
    
    Logger& logger = Logger::getInstance();
    if (!logger.setLogLevel(config.logLevel)) {
        std::cerr << "Warning: Unknown log level '" << config.logLevel << "', using INFO" << std::endl;
        logger.setLogLevel(LogLevel::INFO);
    }
    if (verbose) {
        logger.setLogLevel(LogLevel::DEBUG);
    }
    logger.setConsoleOutput(config.consoleLog);
    logger.setLogFile(config.logFile);
    
    CurlGlobal curlGlobal;
    if (!curlGlobal.ok) {
        std::cerr << "Error: Failed to initialize libcurl" << std::endl;
        return EXIT_TRANSPORT;
    }
    
    try {
        auto transport = std::make_shared<CurlTransport>(config.httpConfig);
        Client client(config.client, transport);
        
        json result;
        const auto& args = commandArgs;
        if (command == "send") {
            SendArguments send = CommandLine::parseSendArguments(args);
            result = client.sendDataPoint(send.feedKey, send.point);
        } else if (command == "receive") {
            if (!expectArgs(command, args, 1)) return EXIT_USAGE;
            result = client.receiveData(args[0]);
        } else if (command == "delete-data") {
            if (!expectArgs(command, args, 2)) return EXIT_USAGE;
            result = client.deleteData(args[0], args[1]);
        } else if (command == "feed") {
            if (!expectArgs(command, args, 1)) return EXIT_USAGE;
            result = client.getFeed(args[0]);
        } else if (command == "feeds") {
            if (!expectArgs(command, args, 0)) return EXIT_USAGE;
            result = client.getAllFeeds();
        } else if (command == "delete-feed") {
            if (!expectArgs(command, args, 1)) return EXIT_USAGE;
            result = client.deleteFeed(args[0]);
        } else if (command == "groups") {
            if (!expectArgs(command, args, 0)) return EXIT_USAGE;
            result = client.getAllGroups();
        } else if (command == "create-group") {
            if (!expectArgs(command, args, 2)) return EXIT_USAGE;
            result = client.createNewGroup(args[0], args[1]);
        } else {
            std::cerr << "Error: Unknown command " << command << std::endl;
            printHelp(argv[0]);
            return EXIT_USAGE;
        }
        
        std::cout << result.dump(2) << std::endl;
        return EXIT_OK;
        
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const TransportError& e) {
        std::cerr << "Transport error: " << e.what() << std::endl;
        return EXIT_TRANSPORT;
    } catch (const APIError& e) {
        std::cerr << "API error (HTTP " << e.statusCode() << "): " << e.body() << std::endl;
        return EXIT_API;
    } catch (const DecodingError& e) {
        std::cerr << "Decoding error: " << e.what() << std::endl;
        return EXIT_DECODING;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}

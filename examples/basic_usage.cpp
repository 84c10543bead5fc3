// Basic JsonCatchAll usage example
// Build: cmake -S . -B build && cmake --build build --target basic_usage

#include <JsonCatchAll/codec.hpp>
#include <JsonCatchAll/error_formatting.hpp>
#include <JsonCatchAll/tagged.hpp>
#include <iostream>
#include <string>

using namespace JsonCatchAll;

struct AppConfig {
    std::string app_name;
    int version;
    Tagged<bool, "debug,omitempty"> debug_mode;

    struct Server {
        std::string host;
        int port;
    };
    Server server;

    // Everything else in the document lands here, and is written back on output
    Tagged<AdditionalProperties, "*"> rest;
};

int main() {
    const char* json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug": true,
        "server": {
            "host": "localhost",
            "port": 8080
        },
        "plugins": ["auth", "metrics"],
        "owner": {"team": "infra"}
    })";

    auto codec = makeCompatibleCodec();

    AppConfig config;
    auto result = codec->Parse(config, std::string_view(json));

    if (!result) {
        std::cout << ParseResultToString(result, json) << std::endl;
        return 1;
    }

    std::cout << "Successfully parsed!" << std::endl;
    std::cout << "App: " << config.app_name << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Debug: " << (config.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;
    for (const auto & [key, value] : config.rest.get()) {
        std::cout << "Unknown key " << key << " = " << value.bytes << std::endl;
    }

    config.version = 2;
    std::string out;
    auto written = codec->Serialize(config, out);
    if (!written) {
        std::cout << SerializeResultToString(written) << std::endl;
        return 1;
    }
    std::cout << out << std::endl;

    return 0;
}

#include "config.hpp"
#include "web_server.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[]) {
    std::string config_path = "config/featurizer.yaml";
    std::string host;
    int port = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [config.yaml] [options]\n\n"
                      << "Options:\n"
                      << "  --config PATH  Config file (default: config/featurizer.yaml)\n"
                      << "  --host HOST    Host (overrides server.host)\n"
                      << "  --port PORT    Port (overrides server.port)\n";
            return 0;
        } else if (i == 1 && arg[0] != '-') {
            config_path = arg;
        }
    }

    try {
        urlfeat::AppConfig app = urlfeat::load_config(config_path);

        urlfeat::WebServer::Config config;
        config.host = host.empty() ? app.server.host : host;
        config.port = port > 0 ? port : app.server.port;

        urlfeat::WebServer server(config, urlfeat::build_featurizer(app));
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

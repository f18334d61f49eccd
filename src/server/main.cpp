// =============================================================================
// hashsweep_server - HTTP front-end for hashsweep
// =============================================================================
//
// Usage:
//   hashsweep_server [config.yaml]
//
// Listens on server.host:server.port. Results and log paths come from the
// output section of the configuration.
//
// =============================================================================

#include "hashsweep/config.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/http_server.hpp"
#include "hashsweep/logging.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config.yaml";

    hashsweep::PipelineConfig config;
    try {
        config = hashsweep::load_config(config_path);
    } catch (const hashsweep::HashsweepException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    try {
        // One process, one sink: request handlers read the log back from it
        auto logger = hashsweep::Logger::shared(config.log_options());
        HASHSWEEP_LOG_INFO("Configuration loaded from " + config_path);

        hashsweep::HttpServer server(config, logger);
        std::cout << "Press Ctrl+C to stop the server" << std::endl;
        server.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

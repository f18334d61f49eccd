// =============================================================================
// hashsweep - parallel digest sweep
// =============================================================================
//
// Hashes every candidate of a CSV file with the configured algorithm across a
// pool of workers and reports the candidates whose digest equals the target.
//
// Usage:
//   hashsweep [config.yaml]
//
// Exit codes:
//   0  sweep completed (a failure to write the report is logged, not fatal)
//   1  setup failure or a worker did not finish cleanly
//
// =============================================================================

#include "hashsweep/config.hpp"
#include "hashsweep/error.hpp"
#include "hashsweep/logging.hpp"
#include "hashsweep/pipeline.hpp"
#include "hashsweep/timer.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config.yaml";

    if (config_path == "-h" || config_path == "--help") {
        std::cout << "Usage: " << argv[0] << " [config.yaml]\n";
        return 0;
    }

    hashsweep::PipelineConfig config;
    try {
        config = hashsweep::load_config(config_path);
    } catch (const hashsweep::HashsweepException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::shared_ptr<hashsweep::Logger> logger;
    try {
        logger = hashsweep::Logger::create(config.log_options());
    } catch (const hashsweep::IOError& e) {
        std::cerr << "Logging setup failed: " << e.what() << std::endl;
        return 1;
    }

    try {
        logger->info("Configuration loaded from " + config_path);

        hashsweep::Pipeline pipeline(config, logger);
        hashsweep::PipelineOutcome outcome = pipeline.run();

        if (!outcome.persisted) {
            logger->warning("Results were not saved: " + outcome.persistence_error);
        }
        if (!outcome.processing_ok) {
            logger->error("Sweep finished with worker failures");
            return 1;
        }

        logger->info("Sweep finished in " + hashsweep::Timer::format(outcome.elapsed_seconds) + ": " +
                     std::to_string(outcome.report.total_matches) + " matches");
        return 0;
    } catch (const hashsweep::HashsweepException& e) {
        logger->critical(std::string("Fatal error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger->critical(std::string("Unexpected fatal error: ") + e.what());
        return 1;
    }
}

#pragma once

#include "hashsweep/hasher.hpp"
#include "hashsweep/logging.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace hashsweep {

struct GeneralConfig {
    std::size_t worker_count = 4;
    std::size_t chunk_size = 1000;
    std::uint32_t worker_timeout_ms = 5000;
};

struct HashConfig {
    std::string algorithm = "SHA256";
    std::string target_hash;
    std::uint32_t pbkdf2_iterations = 100000;
    std::size_t pbkdf2_salt_length = 32;
    std::string pbkdf2_salt;    // hex; empty means zero-filled
};

struct InputConfig {
    std::string csv_path;
    char csv_delimiter = ',';
};

struct OutputConfig {
    std::string results_path = "logs/results.json";
    std::string log_path = "logs/hashsweep.log";
    bool verbose = true;
};

struct ServerConfig {
    std::string host = "localhost";
    std::uint16_t port = 8080;
    std::string html_file = "web/index.html";
};

struct PipelineConfig {
    GeneralConfig general;
    HashConfig hash;
    InputConfig input;
    OutputConfig output;
    ServerConfig server;
    std::string config_file;

    // Throws ConfigError on an unknown algorithm or malformed salt.
    HashSettings hash_settings() const;
    LogOptions log_options() const;
};

/**
 * Load configuration from a YAML file.
 * Sections general, hash, input and output are required; every key inside
 * them falls back to its default. The result is validated before return.
 * @throws IOError if the file cannot be read, ConfigError if it is invalid
 */
PipelineConfig load_config(const std::string& config_file = "config.yaml");

// Same rules applied to YAML text already in memory.
PipelineConfig parse_config(const std::string& yaml_text);

/**
 * Build configuration from a JSON object (HTTP adapter requests).
 * Sections general and hash are required; input and output are optional.
 */
PipelineConfig config_from_json(const boost::json::object& object);

// Throws ConfigError describing the first violated rule.
void validate_config(const PipelineConfig& config);

} // namespace hashsweep

#include "hashsweep/config.hpp"
#include "hashsweep/error.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <initializer_list>

namespace hashsweep {

namespace {

void require_sections(const YAML::Node& root, std::initializer_list<const char*> sections) {
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }
    for (const char* section : sections) {
        if (!root[section]) {
            throw ConfigError(std::string("Missing required configuration section: ") + section);
        }
    }
}

char parse_delimiter(const std::string& value) {
    if (value.size() != 1) {
        throw ConfigError("csv_delimiter must be a single character", value);
    }
    return value[0];
}

PipelineConfig config_from_yaml(const YAML::Node& root) {
    PipelineConfig config;

    try {
        require_sections(root, {"general", "hash", "input", "output"});

        const auto& general = root["general"];
        if (general["worker_count"]) config.general.worker_count = general["worker_count"].as<std::size_t>();
        if (general["chunk_size"]) config.general.chunk_size = general["chunk_size"].as<std::size_t>();
        if (general["worker_timeout_ms"]) config.general.worker_timeout_ms = general["worker_timeout_ms"].as<std::uint32_t>();

        const auto& hash = root["hash"];
        if (hash["algorithm"]) config.hash.algorithm = hash["algorithm"].as<std::string>();
        if (hash["target_hash"]) config.hash.target_hash = hash["target_hash"].as<std::string>();
        if (hash["pbkdf2_iterations"]) config.hash.pbkdf2_iterations = hash["pbkdf2_iterations"].as<std::uint32_t>();
        if (hash["pbkdf2_salt_length"]) config.hash.pbkdf2_salt_length = hash["pbkdf2_salt_length"].as<std::size_t>();
        if (hash["pbkdf2_salt"]) config.hash.pbkdf2_salt = hash["pbkdf2_salt"].as<std::string>();

        const auto& input = root["input"];
        if (input["csv_path"]) config.input.csv_path = input["csv_path"].as<std::string>();
        if (input["csv_delimiter"]) config.input.csv_delimiter = parse_delimiter(input["csv_delimiter"].as<std::string>());

        const auto& output = root["output"];
        if (output["results_path"]) config.output.results_path = output["results_path"].as<std::string>();
        if (output["log_path"]) config.output.log_path = output["log_path"].as<std::string>();
        if (output["verbose"]) config.output.verbose = output["verbose"].as<bool>();

        if (root["server"]) {
            const auto& server = root["server"];
            if (server["host"]) config.server.host = server["host"].as<std::string>();
            if (server["port"]) config.server.port = server["port"].as<std::uint16_t>();
            if (server["html_file"]) config.server.html_file = server["html_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid configuration value", e.what());
    }

    return config;
}

const boost::json::object* json_section(const boost::json::object& root, const char* name, bool required) {
    auto it = root.find(name);
    if (it == root.end()) {
        if (required) {
            throw ConfigError(std::string("Missing required configuration section: ") + name);
        }
        return nullptr;
    }
    if (!it->value().is_object()) {
        throw ConfigError(std::string("Configuration section must be an object: ") + name);
    }
    return &it->value().as_object();
}

template<typename T>
void json_read(const boost::json::object& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->value().is_null()) {
        return;
    }
    try {
        target = boost::json::value_to<T>(it->value());
    } catch (const std::exception& e) {
        throw ConfigError(std::string("Invalid configuration value for '") + key + "'", e.what());
    }
}

} // namespace

HashSettings PipelineConfig::hash_settings() const {
    HashSettings settings;
    settings.algorithm = parse_algorithm(hash.algorithm);
    settings.iterations = hash.pbkdf2_iterations;
    settings.salt_length = hash.pbkdf2_salt_length;
    if (!hash.pbkdf2_salt.empty()) {
        settings.salt = from_hex(hash.pbkdf2_salt);
    }
    return settings;
}

LogOptions PipelineConfig::log_options() const {
    LogOptions options;
    options.log_path = output.log_path;
    options.verbose = output.verbose;
    return options;
}

PipelineConfig load_config(const std::string& config_file) {
    if (config_file.empty() || !std::filesystem::exists(config_file)) {
        throw IOError("Configuration file not found", config_file);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_file);
    } catch (const YAML::BadFile&) {
        throw IOError("Cannot read configuration file", config_file, ErrorCode::PERMISSION_DENIED);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid YAML in configuration file", e.what());
    }

    PipelineConfig config = config_from_yaml(root);
    config.config_file = config_file;
    validate_config(config);
    return config;
}

PipelineConfig parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid YAML configuration", e.what());
    }

    PipelineConfig config = config_from_yaml(root);
    validate_config(config);
    return config;
}

PipelineConfig config_from_json(const boost::json::object& object) {
    PipelineConfig config;

    const auto* general = json_section(object, "general", true);
    json_read(*general, "worker_count", config.general.worker_count);
    json_read(*general, "chunk_size", config.general.chunk_size);
    json_read(*general, "worker_timeout_ms", config.general.worker_timeout_ms);

    const auto* hash = json_section(object, "hash", true);
    json_read(*hash, "algorithm", config.hash.algorithm);
    json_read(*hash, "target_hash", config.hash.target_hash);
    json_read(*hash, "pbkdf2_iterations", config.hash.pbkdf2_iterations);
    json_read(*hash, "pbkdf2_salt_length", config.hash.pbkdf2_salt_length);
    json_read(*hash, "pbkdf2_salt", config.hash.pbkdf2_salt);

    if (const auto* input = json_section(object, "input", false)) {
        std::string delimiter;
        json_read(*input, "csv_delimiter", delimiter);
        if (!delimiter.empty()) {
            config.input.csv_delimiter = parse_delimiter(delimiter);
        }
    }

    if (const auto* output = json_section(object, "output", false)) {
        json_read(*output, "verbose", config.output.verbose);
    }

    validate_config(config);
    return config;
}

void validate_config(const PipelineConfig& config) {
    if (config.general.worker_count < 1) {
        throw ConfigError("worker_count must be at least 1");
    }
    if (config.general.chunk_size < 1) {
        throw ConfigError("chunk_size must be at least 1");
    }
    if (config.general.worker_timeout_ms < 1) {
        throw ConfigError("worker_timeout_ms must be at least 1");
    }
    if (config.hash.target_hash.empty()) {
        throw ConfigError("hash.target_hash is required");
    }

    // Resolves the algorithm and decodes the salt.
    make_hasher(config.hash_settings());
}

} // namespace hashsweep

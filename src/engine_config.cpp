// Engine session configuration YAML read/write implementation
#include "engine_config.hpp"

#include <fstream>
#include <iostream>

namespace nw {

EngineConfig EngineConfig::from_yaml(const YAML::Node& root) {
    EngineConfig config;
    if (!root || !root.IsMap()) {
        throw GraphError(GraphErrc::InvalidYaml, "Engine config must be a YAML map.");
    }
    if (root["worker_pool_size"]) config.worker_pool_size = root["worker_pool_size"].as<unsigned>();
    if (root["use_worker_pool"]) config.use_worker_pool = root["use_worker_pool"].as<bool>();
    if (root["queue_concurrency"]) config.queue_concurrency = root["queue_concurrency"].as<unsigned>();
    if (root["cache_backend"]) config.cache_backend = root["cache_backend"].as<std::string>();
    if (root["cache_path"]) config.cache_path = root["cache_path"].as<std::string>();
    if (root["cache_max_age_ms"]) config.cache_max_age_ms = root["cache_max_age_ms"].as<int64_t>();
    if (root["quiet"]) config.quiet = root["quiet"].as<bool>();

    if (config.cache_backend != "memory" && config.cache_backend != "sqlite") {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Unknown cache_backend '" + config.cache_backend + "' (expected memory or sqlite)");
    }
    if (config.queue_concurrency == 0) {
        throw GraphError(GraphErrc::InvalidParameter, "queue_concurrency must be at least 1");
    }
    return config;
}

YAML::Node EngineConfig::to_yaml() const {
    YAML::Node root;
    root["_comment1"] = "Nodeweave engine configuration.";
    root["worker_pool_size"] = worker_pool_size;
    root["use_worker_pool"] = use_worker_pool;
    root["queue_concurrency"] = queue_concurrency;
    root["cache_backend"] = cache_backend;
    root["cache_path"] = cache_path;
    root["cache_max_age_ms"] = cache_max_age_ms;
    root["quiet"] = quiet;
    return root;
}

bool write_engine_config(const EngineConfig& config, const std::string& path) {
    std::ofstream fout(path);
    if (!fout) {
        return false;
    }
    fout << config.to_yaml();
    return static_cast<bool>(fout);
}

EngineConfig load_or_create_engine_config(const std::string& config_path) {
    EngineConfig config;
    if (fs::exists(config_path)) {
        try {
            config = EngineConfig::from_yaml(YAML::LoadFile(config_path));
            config.loaded_config_path = fs::absolute(config_path).string();
            if (!config.quiet) {
                std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
            config = EngineConfig();
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_engine_config(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    }
    return config;
}

} // namespace nw

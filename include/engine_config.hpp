// Engine session configuration definition and YAML I/O declarations
#pragma once

#include <cstdint>
#include <string>

#include <yaml-cpp/yaml.h>

#include "nw_types.hpp"

namespace nw {

struct EngineConfig {
    std::string loaded_config_path;
    // 0 -> std::thread::hardware_concurrency()
    unsigned worker_pool_size = 0;
    bool use_worker_pool = true;
    unsigned queue_concurrency = 1;
    std::string cache_backend = "memory";  // "memory" | "sqlite"
    std::string cache_path = "cache/results.db";
    int64_t cache_max_age_ms = 7LL * 24 * 60 * 60 * 1000;
    bool quiet = true;

    static EngineConfig from_yaml(const YAML::Node& root);
    YAML::Node to_yaml() const;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
NODEWEAVE_API bool write_engine_config(const EngineConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
NODEWEAVE_API EngineConfig load_or_create_engine_config(const std::string& config_path);

} // namespace nw

#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct StorageConfig {
    std::string backend = "sqlite"; // "sqlite" or "json"
    std::string path;               // empty = ~/.engram/memory.{db,json}
};

struct ReconsolidationConfig {
    uint64_t lability_window_ms = 300000;   // 5 minutes
    uint64_t min_interval_ms = 3600000;     // 1 hour between windows
    bool allow_weakening = true;
    double deletion_threshold = 0.1;        // confidence below this archives
    std::vector<std::string> qualifying_triggers = {"explicit_recall", "search"};
    uint64_t retry_delay_ms = 1000;         // automatic close retry after a failure
};

struct RetrievalConfig {
    double text_weight = 0.55;
    double recency_weight = 0.2;
    double importance_weight = 0.15;
    double frequency_weight = 0.1;
    uint64_t recency_half_life_ms = 604800000; // 7 days
    uint32_t default_limit = 50;
};

struct ExportConfig {
    uint32_t page_size = 50;
    std::string agent_name;
};

struct Config {
    std::string agent_id = "agent_default";
    std::string agent_version;

    StorageConfig storage;
    ReconsolidationConfig reconsolidation;
    RetrievalConfig retrieval;
    ExportConfig export_;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config object. Missing or mistyped keys keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Resolved storage path for the configured backend
    std::string storage_path() const;
};

} // namespace engram

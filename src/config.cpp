#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

nlohmann::json Config::defaults_json() {
    return {
        {"agent_id", "agent_default"},
        {"agent_version", ""},
        {"storage", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"reconsolidation", {
            {"lability_window_ms", 300000},
            {"min_interval_ms", 3600000},
            {"allow_weakening", true},
            {"deletion_threshold", 0.1},
            {"qualifying_triggers", {"explicit_recall", "search"}},
            {"retry_delay_ms", 1000}
        }},
        {"retrieval", {
            {"text_weight", 0.55},
            {"recency_weight", 0.2},
            {"importance_weight", 0.15},
            {"frequency_weight", 0.1},
            {"recency_half_life_ms", 604800000},
            {"default_limit", 50}
        }},
        {"export", {
            {"page_size", 50},
            {"agent_name", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Non-negative integer field; anything else keeps the default.
template <typename T>
static void read_unsigned(const nlohmann::json& obj, const char* key, T& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) {
        out = v.get<T>();
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        out = static_cast<T>(v.get<int64_t>());
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("agent_id") && j["agent_id"].is_string())
        cfg.agent_id = j["agent_id"].get<std::string>();
    if (j.contains("agent_version") && j["agent_version"].is_string())
        cfg.agent_version = j["agent_version"].get<std::string>();

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.storage.backend = s["backend"].get<std::string>();
        if (s.contains("path") && s["path"].is_string())
            cfg.storage.path = s["path"].get<std::string>();
    }

    if (j.contains("reconsolidation") && j["reconsolidation"].is_object()) {
        auto& r = j["reconsolidation"];
        read_unsigned(r, "lability_window_ms", cfg.reconsolidation.lability_window_ms);
        read_unsigned(r, "min_interval_ms", cfg.reconsolidation.min_interval_ms);
        if (r.contains("allow_weakening") && r["allow_weakening"].is_boolean())
            cfg.reconsolidation.allow_weakening = r["allow_weakening"].get<bool>();
        if (r.contains("deletion_threshold") && r["deletion_threshold"].is_number())
            cfg.reconsolidation.deletion_threshold = r["deletion_threshold"].get<double>();
        if (r.contains("qualifying_triggers") && r["qualifying_triggers"].is_array()) {
            cfg.reconsolidation.qualifying_triggers.clear();
            for (const auto& t : r["qualifying_triggers"]) {
                if (t.is_string())
                    cfg.reconsolidation.qualifying_triggers.push_back(t.get<std::string>());
            }
        }
        read_unsigned(r, "retry_delay_ms", cfg.reconsolidation.retry_delay_ms);
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        auto& r = j["retrieval"];
        if (r.contains("text_weight") && r["text_weight"].is_number())
            cfg.retrieval.text_weight = r["text_weight"].get<double>();
        if (r.contains("recency_weight") && r["recency_weight"].is_number())
            cfg.retrieval.recency_weight = r["recency_weight"].get<double>();
        if (r.contains("importance_weight") && r["importance_weight"].is_number())
            cfg.retrieval.importance_weight = r["importance_weight"].get<double>();
        if (r.contains("frequency_weight") && r["frequency_weight"].is_number())
            cfg.retrieval.frequency_weight = r["frequency_weight"].get<double>();
        read_unsigned(r, "recency_half_life_ms", cfg.retrieval.recency_half_life_ms);
        read_unsigned(r, "default_limit", cfg.retrieval.default_limit);
    }

    if (j.contains("export") && j["export"].is_object()) {
        auto& e = j["export"];
        read_unsigned(e, "page_size", cfg.export_.page_size);
        if (e.contains("agent_name") && e["agent_name"].is_string())
            cfg.export_.agent_name = e["agent_name"].get<std::string>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment overrides
    if (const char* v = std::getenv("ENGRAM_DB_PATH")) cfg.storage.path = v;
    if (const char* v = std::getenv("ENGRAM_BACKEND")) cfg.storage.backend = v;
    if (const char* v = std::getenv("ENGRAM_AGENT_ID")) cfg.agent_id = v;

    return cfg;
}

std::string Config::storage_path() const {
    if (!storage.path.empty()) return expand_home(storage.path);
    if (storage.backend == "json") return expand_home("~/.engram/memory.json");
    return expand_home("~/.engram/memory.db");
}

} // namespace engram

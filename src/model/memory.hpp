#pragma once
#include "../errors.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace engram {

constexpr int CURRENT_SCHEMA_VERSION = 1;

enum class MemoryType { Episodic, Semantic, Procedural };
enum class Importance { Critical, High, Normal, Low };

struct EpisodicData {
    uint64_t event_timestamp = 0;
    std::string event_type;
    std::vector<std::string> participants;
    std::optional<std::string> location;
    std::optional<double> emotional_valence;  // [-1, 1]
    std::vector<std::string> emotional_tags;
    std::optional<std::string> source_conversation_id;
    std::vector<std::string> source_message_ids;
};

struct SemanticData {
    std::string domain;
    double confidence = 1.0;                   // [0, 1]
    std::vector<std::string> source_memory_ids;
    std::vector<std::string> contradicts_ids;
    std::optional<uint64_t> valid_from;
    std::optional<uint64_t> valid_until;
};

struct FailureMode {
    std::string pattern;
    std::string recovery;
};

struct ProceduralStep {
    uint32_t order = 0;
    std::string description;
    std::optional<std::string> command;
    std::optional<std::string> expected_outcome;
    std::vector<FailureMode> failure_modes;
};

struct TriggerConditions {
    std::vector<std::string> keywords;
    std::vector<std::string> request_patterns;
    std::map<std::string, std::string> required_context;

    bool empty() const {
        return keywords.empty() && request_patterns.empty() && required_context.empty();
    }
};

struct ProceduralData {
    std::string skill_name;
    std::vector<ProceduralStep> steps;
    TriggerConditions trigger_conditions;
    uint32_t success_count = 0;
    uint32_t failure_count = 0;
    std::optional<uint64_t> last_success;
    std::optional<uint64_t> last_failure;
    std::optional<double> avg_duration_ms;
};

// Alternative order matches MemoryType.
using MemoryDetail = std::variant<EpisodicData, SemanticData, ProceduralData>;

struct Memory {
    std::string id;
    std::string content;
    std::optional<std::string> context;
    Importance importance = Importance::Normal;
    std::vector<std::string> tags;
    std::optional<std::vector<float>> embedding; // opaque to the engine
    uint64_t created_at = 0;
    uint32_t access_count = 0;
    std::optional<uint64_t> last_accessed;
    bool is_consolidated = false;
    bool is_archived = false;                    // tombstone
    int schema_version = CURRENT_SCHEMA_VERSION;
    MemoryDetail detail;

    MemoryType type() const { return static_cast<MemoryType>(detail.index()); }

    // Semantic confidence, or nullopt for the other variants.
    std::optional<double> confidence() const;
};

std::string memory_type_to_string(MemoryType type);
std::optional<MemoryType> memory_type_from_string(const std::string& s);

std::string importance_to_string(Importance importance);
std::optional<Importance> importance_from_string(const std::string& s);

// critical = 3 ... low = 0
int importance_rank(Importance importance);

// Typed constructors. The id and created_at are assigned on creation.
Memory make_episodic(const std::string& content, const std::string& event_type,
                     uint64_t event_timestamp);
Memory make_semantic(const std::string& content, const std::string& domain,
                     double confidence = 1.0);
Memory make_procedural(const std::string& content, const std::string& skill_name,
                       std::vector<ProceduralStep> steps);

// Checks every bound and ordering rule of a memory record.
// Returns nullopt if valid.
std::optional<ValidationError> validate(const Memory& memory);

// Same checks for a draft that has no id yet.
std::optional<ValidationError> validate_draft(const Memory& memory);

// Answers whether a memory id resolves (live or archived).
using MemoryResolver = std::function<bool(const std::string&)>;

// Semantic source_memory_ids and contradicts_ids must name stored
// memories. Returns nullopt if every reference resolves.
std::optional<ValidationError> validate_references(const Memory& memory,
                                                   const MemoryResolver& resolves);

} // namespace engram

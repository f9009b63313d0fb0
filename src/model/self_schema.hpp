#pragma once
#include "../errors.hpp"
#include "memory.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace engram {

enum class Trajectory { Improving, Stable, Declining };
enum class EntityType { User, Agent, System };
enum class LimitationType { Technical, Ethical, Knowledge, Capability };
enum class MilestoneCategory { Learning, Achievement, Relationship, Challenge, Growth, Setback };
enum class Horizon { Near, Medium, Far };
enum class Desirability { Desired, Neutral, Concerning };

// ── Present self ─────────────────────────────────────────────

struct IdentityStatement {
    std::string id;
    std::string statement;
    double centrality = 0.5;   // [0, 1]
    double confidence = 0.5;   // [0, 1]
    std::vector<std::string> source_memory_ids;
    uint64_t established_at = 0;
    uint64_t last_reinforced_at = 0;
};

struct Capability {
    std::string id;
    std::string name;
    std::string description;
    std::string domain;
    double proficiency = 0.5;  // [0, 1]
    std::vector<std::string> evidence_memory_ids;
    uint64_t recognized_at = 0;
    Trajectory trajectory = Trajectory::Stable;
};

struct Relationship {
    std::string id;
    std::string entity_id;
    EntityType entity_type = EntityType::User;
    std::string nature;
    double strength = 0.5;     // [0, 1]
    std::vector<std::string> key_memory_ids;
    std::string history_summary;
    uint64_t established_at = 0;
    uint64_t last_interaction_at = 0;
};

struct AgentState {
    std::string mood;
    double energy_level = 0.5; // [0, 1]
    std::string current_focus;
    std::vector<std::string> active_concerns;
    uint64_t updated_at = 0;
};

struct Value {
    std::string id;
    std::string statement;
    int importance = 5;        // [1, 10]
    std::vector<std::string> examples;
    uint64_t established_at = 0;
};

struct Limitation {
    std::string id;
    std::string description;
    LimitationType type = LimitationType::Knowledge;
    std::string discovery_context;
    uint64_t discovered_at = 0;
};

struct PresentSelf {
    std::vector<IdentityStatement> identity_statements;
    std::vector<Capability> capabilities;
    std::vector<Relationship> relationships;
    AgentState current_state;
    std::vector<Value> values;
    std::vector<Limitation> limitations;
};

// ── Temporal trajectory ──────────────────────────────────────

struct Milestone {
    std::string id;
    std::string title;
    std::string description;
    uint64_t occurred_at = 0;
    int significance = 5;      // [1, 10]
    std::string impact;
    std::vector<std::string> related_memory_ids;
    MilestoneCategory category = MilestoneCategory::Learning;
};

struct PhaseDescription {
    std::string name;
    std::string description;
    uint64_t started_at = 0;
    std::vector<std::string> themes;
    std::vector<std::string> active_goals;
};

struct FutureAnticipation {
    std::string id;
    std::string description;
    Horizon horizon = Horizon::Near;
    double likelihood = 0.5;   // [0, 1]
    Desirability desirability = Desirability::Neutral;
    std::vector<std::string> prerequisites;
};

struct TrajectoryPattern {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> instances;
    double confidence = 0.5;   // [0, 1]
};

struct TemporalTrajectory {
    std::vector<Milestone> past_milestones;
    PhaseDescription current_phase;
    std::vector<FutureAnticipation> anticipated_futures;
    std::vector<TrajectoryPattern> patterns;
};

// ── Autobiographical narrative ───────────────────────────────

struct TimeSpan {
    uint64_t start = 0;
    std::optional<uint64_t> end;
};

struct NarrativeChapter {
    std::string id;
    std::string title;
    std::string narrative;
    TimeSpan time_span;
    std::vector<std::string> source_memory_ids;
    std::string emotional_arc;
};

struct NarrativeTheme {
    std::string id;
    std::string name;
    std::string manifestation;
    std::vector<std::string> chapter_ids;
    int centrality = 5;        // [1, 10]
};

struct NarrativeRevision {
    uint64_t revised_at = 0;
    std::string changes;
    std::string reason;
    std::vector<std::string> trigger_memory_ids;
};

struct AutobiographicalNarrative {
    std::string core_summary;
    std::vector<NarrativeChapter> chapters;
    std::vector<NarrativeTheme> themes;
    std::vector<NarrativeRevision> narrative_evolution;
    uint64_t last_synthesized_at = 0;
};

struct SelfSchema {
    std::string id;
    std::string agent_id;
    PresentSelf present_self;
    TemporalTrajectory temporal_trajectory;
    AutobiographicalNarrative autobiographical_narrative;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    uint32_t version = 1;
};

// Empty schema for an agent, version 1.
SelfSchema make_self_schema(const std::string& agent_id, uint64_t now);

// Checks bounds, evidence and that every memory reference resolves.
// Identity statements, capabilities and chapters without evidence fail
// with MissingEvidence; unresolved references fail with ValidationError.
std::optional<ValidationError> validate(const SelfSchema& schema,
                                        const MemoryResolver& resolves);

// Every memory id the schema refers to, deduplicated.
std::vector<std::string> referenced_memory_ids(const SelfSchema& schema);

std::string trajectory_to_string(Trajectory t);
std::optional<Trajectory> trajectory_from_string(const std::string& s);
std::string entity_type_to_string(EntityType t);
std::optional<EntityType> entity_type_from_string(const std::string& s);
std::string limitation_type_to_string(LimitationType t);
std::optional<LimitationType> limitation_type_from_string(const std::string& s);
std::string milestone_category_to_string(MilestoneCategory c);
std::optional<MilestoneCategory> milestone_category_from_string(const std::string& s);
std::string horizon_to_string(Horizon h);
std::optional<Horizon> horizon_from_string(const std::string& s);
std::string desirability_to_string(Desirability d);
std::optional<Desirability> desirability_from_string(const std::string& s);

} // namespace engram

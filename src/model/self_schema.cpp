#include "self_schema.hpp"
#include "enum_names.hpp"
#include "../entity_id.hpp"
#include "../util.hpp"
#include <array>
#include <unordered_set>

namespace engram {

static constexpr std::array<const char*, 3> TRAJECTORY_NAMES = {"improving", "stable", "declining"};
static constexpr std::array<const char*, 3> ENTITY_TYPE_NAMES = {"user", "agent", "system"};
static constexpr std::array<const char*, 4> LIMITATION_TYPE_NAMES = {
    "technical", "ethical", "knowledge", "capability"};
static constexpr std::array<const char*, 6> MILESTONE_CATEGORY_NAMES = {
    "learning", "achievement", "relationship", "challenge", "growth", "setback"};
static constexpr std::array<const char*, 3> HORIZON_NAMES = {"near", "medium", "far"};
static constexpr std::array<const char*, 3> DESIRABILITY_NAMES = {"desired", "neutral", "concerning"};


std::string trajectory_to_string(Trajectory t) { return name_of(TRAJECTORY_NAMES, t); }
std::optional<Trajectory> trajectory_from_string(const std::string& s) {
    return value_of<Trajectory>(TRAJECTORY_NAMES, s);
}
std::string entity_type_to_string(EntityType t) { return name_of(ENTITY_TYPE_NAMES, t); }
std::optional<EntityType> entity_type_from_string(const std::string& s) {
    return value_of<EntityType>(ENTITY_TYPE_NAMES, s);
}
std::string limitation_type_to_string(LimitationType t) { return name_of(LIMITATION_TYPE_NAMES, t); }
std::optional<LimitationType> limitation_type_from_string(const std::string& s) {
    return value_of<LimitationType>(LIMITATION_TYPE_NAMES, s);
}
std::string milestone_category_to_string(MilestoneCategory c) {
    return name_of(MILESTONE_CATEGORY_NAMES, c);
}
std::optional<MilestoneCategory> milestone_category_from_string(const std::string& s) {
    return value_of<MilestoneCategory>(MILESTONE_CATEGORY_NAMES, s);
}
std::string horizon_to_string(Horizon h) { return name_of(HORIZON_NAMES, h); }
std::optional<Horizon> horizon_from_string(const std::string& s) {
    return value_of<Horizon>(HORIZON_NAMES, s);
}
std::string desirability_to_string(Desirability d) { return name_of(DESIRABILITY_NAMES, d); }
std::optional<Desirability> desirability_from_string(const std::string& s) {
    return value_of<Desirability>(DESIRABILITY_NAMES, s);
}

SelfSchema make_self_schema(const std::string& agent_id, uint64_t now) {
    SelfSchema schema;
    schema.id = generate_id_at("schema", now);
    schema.agent_id = agent_id;
    schema.created_at = now;
    schema.updated_at = now;
    schema.version = 1;
    schema.present_self.current_state.updated_at = now;
    return schema;
}

// ── Validation helpers ───────────────────────────────────────

static bool in_unit(double v) { return v >= 0.0 && v <= 1.0; }
static bool in_scale(int v) { return v >= 1 && v <= 10; }

static ValidationError bad(const std::string& field, const std::string& message) {
    return ValidationError{ErrorCode::ValidationError, field, message};
}

static std::optional<ValidationError> check_refs(const std::string& field,
                                                 const std::vector<std::string>& ids,
                                                 const MemoryResolver& resolves) {
    for (const auto& id : ids) {
        if (!resolves(id))
            return bad(field, "dangling reference to memory '" + id + "'");
    }
    return std::nullopt;
}

static std::optional<ValidationError> check_evidence(const std::string& field,
                                                     const std::string& owner,
                                                     const std::vector<std::string>& ids,
                                                     const MemoryResolver& resolves) {
    if (ids.empty())
        return ValidationError{ErrorCode::MissingEvidence, field,
                               "'" + owner + "' cites no memory as evidence"};
    return check_refs(field, ids, resolves);
}

static std::optional<ValidationError> validate_present(const PresentSelf& p,
                                                       const MemoryResolver& resolves) {
    for (const auto& s : p.identity_statements) {
        if (trim(s.statement).empty())
            return bad("identity_statements", "statement must not be empty");
        if (!in_unit(s.centrality))
            return bad("identity_statements.centrality", "must be within [0, 1]");
        if (!in_unit(s.confidence))
            return bad("identity_statements.confidence", "must be within [0, 1]");
        if (auto err = check_evidence("identity_statements.source_memory_ids",
                                      s.statement, s.source_memory_ids, resolves))
            return err;
    }
    for (const auto& c : p.capabilities) {
        if (trim(c.name).empty())
            return bad("capabilities", "name must not be empty");
        if (!in_unit(c.proficiency))
            return bad("capabilities.proficiency", "must be within [0, 1]");
        if (auto err = check_evidence("capabilities.evidence_memory_ids",
                                      c.name, c.evidence_memory_ids, resolves))
            return err;
    }
    for (const auto& r : p.relationships) {
        if (r.entity_id.empty())
            return bad("relationships.entity_id", "must not be empty");
        if (!in_unit(r.strength))
            return bad("relationships.strength", "must be within [0, 1]");
        if (auto err = check_refs("relationships.key_memory_ids", r.key_memory_ids, resolves))
            return err;
    }
    if (!in_unit(p.current_state.energy_level))
        return bad("current_state.energy_level", "must be within [0, 1]");
    for (const auto& v : p.values) {
        if (trim(v.statement).empty())
            return bad("values", "statement must not be empty");
        if (!in_scale(v.importance))
            return bad("values.importance", "must be within [1, 10]");
    }
    for (const auto& l : p.limitations) {
        if (trim(l.description).empty())
            return bad("limitations", "description must not be empty");
    }
    return std::nullopt;
}

static std::optional<ValidationError> validate_trajectory(const TemporalTrajectory& t,
                                                          const MemoryResolver& resolves) {
    for (const auto& m : t.past_milestones) {
        if (trim(m.title).empty())
            return bad("past_milestones", "title must not be empty");
        if (!in_scale(m.significance))
            return bad("past_milestones.significance", "must be within [1, 10]");
        if (auto err = check_refs("past_milestones.related_memory_ids",
                                  m.related_memory_ids, resolves))
            return err;
    }
    for (const auto& f : t.anticipated_futures) {
        if (!in_unit(f.likelihood))
            return bad("anticipated_futures.likelihood", "must be within [0, 1]");
    }
    for (const auto& p : t.patterns) {
        if (!in_unit(p.confidence))
            return bad("patterns.confidence", "must be within [0, 1]");
    }
    return std::nullopt;
}

static std::optional<ValidationError> validate_narrative(const AutobiographicalNarrative& n,
                                                         const MemoryResolver& resolves) {
    std::unordered_set<std::string> chapter_ids;
    for (const auto& ch : n.chapters) {
        if (trim(ch.title).empty())
            return bad("chapters", "title must not be empty");
        if (ch.time_span.end && *ch.time_span.end < ch.time_span.start)
            return bad("chapters.time_span", "end must not precede start");
        if (auto err = check_evidence("chapters.source_memory_ids",
                                      ch.title, ch.source_memory_ids, resolves))
            return err;
        chapter_ids.insert(ch.id);
    }
    for (const auto& th : n.themes) {
        if (!in_scale(th.centrality))
            return bad("themes.centrality", "must be within [1, 10]");
        for (const auto& cid : th.chapter_ids) {
            if (chapter_ids.count(cid) == 0)
                return bad("themes.chapter_ids", "dangling reference to chapter '" + cid + "'");
        }
    }
    for (const auto& rev : n.narrative_evolution) {
        if (auto err = check_refs("narrative_evolution.trigger_memory_ids",
                                  rev.trigger_memory_ids, resolves))
            return err;
    }
    return std::nullopt;
}

std::optional<ValidationError> validate(const SelfSchema& schema,
                                        const MemoryResolver& resolves) {
    if (schema.agent_id.empty())
        return bad("agent_id", "must not be empty");
    if (schema.version < 1)
        return bad("version", "must be at least 1");
    if (auto err = validate_present(schema.present_self, resolves)) return err;
    if (auto err = validate_trajectory(schema.temporal_trajectory, resolves)) return err;
    return validate_narrative(schema.autobiographical_narrative, resolves);
}

std::vector<std::string> referenced_memory_ids(const SelfSchema& schema) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::vector<std::string>& ids) {
        for (const auto& id : ids) {
            if (seen.insert(id).second) out.push_back(id);
        }
    };
    const auto& p = schema.present_self;
    for (const auto& s : p.identity_statements) add(s.source_memory_ids);
    for (const auto& c : p.capabilities) add(c.evidence_memory_ids);
    for (const auto& r : p.relationships) add(r.key_memory_ids);
    for (const auto& m : schema.temporal_trajectory.past_milestones) add(m.related_memory_ids);
    const auto& n = schema.autobiographical_narrative;
    for (const auto& ch : n.chapters) add(ch.source_memory_ids);
    for (const auto& rev : n.narrative_evolution) add(rev.trigger_memory_ids);
    return out;
}

} // namespace engram

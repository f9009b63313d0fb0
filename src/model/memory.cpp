#include "memory.hpp"
#include "../util.hpp"

namespace engram {

std::optional<double> Memory::confidence() const {
    if (auto* sem = std::get_if<SemanticData>(&detail)) return sem->confidence;
    return std::nullopt;
}

std::string memory_type_to_string(MemoryType type) {
    switch (type) {
        case MemoryType::Episodic:   return "episodic";
        case MemoryType::Semantic:   return "semantic";
        case MemoryType::Procedural: return "procedural";
    }
    return "episodic";
}

std::optional<MemoryType> memory_type_from_string(const std::string& s) {
    if (s == "episodic")   return MemoryType::Episodic;
    if (s == "semantic")   return MemoryType::Semantic;
    if (s == "procedural") return MemoryType::Procedural;
    return std::nullopt;
}

std::string importance_to_string(Importance importance) {
    switch (importance) {
        case Importance::Critical: return "critical";
        case Importance::High:     return "high";
        case Importance::Normal:   return "normal";
        case Importance::Low:      return "low";
    }
    return "normal";
}

std::optional<Importance> importance_from_string(const std::string& s) {
    if (s == "critical") return Importance::Critical;
    if (s == "high")     return Importance::High;
    if (s == "normal")   return Importance::Normal;
    if (s == "low")      return Importance::Low;
    return std::nullopt;
}

int importance_rank(Importance importance) {
    switch (importance) {
        case Importance::Critical: return 3;
        case Importance::High:     return 2;
        case Importance::Normal:   return 1;
        case Importance::Low:      return 0;
    }
    return 1;
}

Memory make_episodic(const std::string& content, const std::string& event_type,
                     uint64_t event_timestamp) {
    Memory m;
    m.content = content;
    EpisodicData ep;
    ep.event_type = event_type;
    ep.event_timestamp = event_timestamp;
    m.detail = std::move(ep);
    return m;
}

Memory make_semantic(const std::string& content, const std::string& domain,
                     double confidence) {
    Memory m;
    m.content = content;
    SemanticData sem;
    sem.domain = domain;
    sem.confidence = confidence;
    m.detail = std::move(sem);
    return m;
}

Memory make_procedural(const std::string& content, const std::string& skill_name,
                       std::vector<ProceduralStep> steps) {
    Memory m;
    m.content = content;
    ProceduralData proc;
    proc.skill_name = skill_name;
    proc.steps = std::move(steps);
    m.detail = std::move(proc);
    return m;
}

static ValidationError invalid(const std::string& field, const std::string& message) {
    return ValidationError{ErrorCode::ValidationError, field, message};
}

static ValidationError schema_violation(const std::string& field, const std::string& message) {
    return ValidationError{ErrorCode::SchemaViolation, field, message};
}

static std::optional<ValidationError> validate_detail(const EpisodicData& ep) {
    if (ep.event_type.empty())
        return schema_violation("event_type", "episodic memory requires an event type");
    if (ep.emotional_valence) {
        double v = *ep.emotional_valence;
        if (!(v >= -1.0 && v <= 1.0))
            return invalid("emotional_valence", "must be within [-1, 1]");
    }
    return std::nullopt;
}

static std::optional<ValidationError> validate_detail(const SemanticData& sem) {
    if (sem.domain.empty())
        return schema_violation("domain", "semantic memory requires a domain");
    if (!(sem.confidence >= 0.0 && sem.confidence <= 1.0))
        return invalid("confidence", "must be within [0, 1]");
    if (sem.valid_from && sem.valid_until && *sem.valid_from > *sem.valid_until)
        return invalid("valid_from", "must not be later than valid_until");
    return std::nullopt;
}

static std::optional<ValidationError> validate_detail(const ProceduralData& proc) {
    if (proc.skill_name.empty())
        return schema_violation("skill_name", "procedural memory requires a skill name");
    if (proc.steps.empty())
        return schema_violation("steps", "procedural memory requires at least one step");
    for (size_t i = 0; i < proc.steps.size(); ++i) {
        const auto& step = proc.steps[i];
        if (step.description.empty())
            return invalid("steps", "step " + std::to_string(step.order) + " has no description");
        if (i > 0 && step.order <= proc.steps[i - 1].order)
            return invalid("steps", "step orders must be strictly increasing");
    }
    if (proc.avg_duration_ms && *proc.avg_duration_ms < 0.0)
        return invalid("avg_duration_ms", "must not be negative");
    return std::nullopt;
}

std::optional<ValidationError> validate_draft(const Memory& memory) {
    if (trim(memory.content).empty())
        return invalid("content", "must not be empty");
    if (memory.schema_version < 1)
        return invalid("schema_version", "must be at least 1");
    for (const auto& tag : memory.tags) {
        if (tag.empty()) return invalid("tags", "tags must not be empty strings");
    }
    return std::visit([](const auto& d) { return validate_detail(d); }, memory.detail);
}

std::optional<ValidationError> validate(const Memory& memory) {
    if (memory.id.empty())
        return invalid("id", "must not be empty");
    return validate_draft(memory);
}

std::optional<ValidationError> validate_references(const Memory& memory,
                                                   const MemoryResolver& resolves) {
    const auto* sem = std::get_if<SemanticData>(&memory.detail);
    if (!sem) return std::nullopt;
    for (const auto& id : sem->source_memory_ids) {
        if (!resolves(id))
            return invalid("source_memory_ids", "dangling reference to memory '" + id + "'");
    }
    for (const auto& id : sem->contradicts_ids) {
        if (!resolves(id))
            return invalid("contradicts_ids", "dangling reference to memory '" + id + "'");
    }
    return std::nullopt;
}

} // namespace engram

#include "self_schema_manager.hpp"
#include "entity_id.hpp"
#include "errors.hpp"
#include <algorithm>

namespace engram {

SelfSchemaManager::SelfSchemaManager(Store& store, std::string agent_id, Clock clock)
    : store_(store), agent_id_(std::move(agent_id)), clock_(std::move(clock)) {}

SelfSchema SelfSchemaManager::load_or_create() {
    if (auto existing = store_.get_self_schema(agent_id_)) return std::move(*existing);
    return make_self_schema(agent_id_, clock_());
}

SelfSchema SelfSchemaManager::current() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_or_create();
}

SelfSchema SelfSchemaManager::update(const std::function<void(SelfSchema&)>& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = store_.get_self_schema(agent_id_);
    bool fresh = !existing;
    SelfSchema schema = fresh ? make_self_schema(agent_id_, clock_()) : std::move(*existing);
    mutator(schema);
    schema.id = schema.id.empty() ? generate_id_at("schema", clock_()) : schema.id;
    schema.agent_id = agent_id_;

    auto resolves = [this](const std::string& memory_id) {
        return store_.get_memory(memory_id).has_value();
    };
    if (auto err = validate(schema, resolves)) err->raise();

    if (!fresh) schema.version += 1;
    schema.updated_at = std::max(clock_(), schema.updated_at);
    store_.put_self_schema(schema);
    return schema;
}

// Find by id or throw NotFound.
template <typename T>
static T& find_entry(std::vector<T>& items, const std::string& id, const char* what) {
    auto it = std::find_if(items.begin(), items.end(), [&id](const T& t) { return t.id == id; });
    if (it == items.end()) {
        throw EngramError(ErrorCode::NotFound, std::string(what) + " '" + id + "' does not exist");
    }
    return *it;
}

IdentityStatement SelfSchemaManager::add_identity_statement(IdentityStatement draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("id", now);
    draft.established_at = now;
    draft.last_reinforced_at = now;
    update([&draft](SelfSchema& s) { s.present_self.identity_statements.push_back(draft); });
    return draft;
}

IdentityStatement SelfSchemaManager::revise_identity_statement(const std::string& id,
                                                               const IdentityStatement& revised) {
    IdentityStatement result;
    update([&](SelfSchema& s) {
        auto& stmt = find_entry(s.present_self.identity_statements, id, "identity statement");
        stmt.statement = revised.statement;
        stmt.centrality = revised.centrality;
        stmt.confidence = revised.confidence;
        stmt.source_memory_ids = revised.source_memory_ids;
        stmt.last_reinforced_at = clock_();
        result = stmt;
    });
    return result;
}

Capability SelfSchemaManager::add_capability(Capability draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("cap", now);
    draft.recognized_at = now;
    update([&draft](SelfSchema& s) { s.present_self.capabilities.push_back(draft); });
    return draft;
}

Capability SelfSchemaManager::revise_capability(const std::string& id, const Capability& revised) {
    Capability result;
    update([&](SelfSchema& s) {
        auto& cap = find_entry(s.present_self.capabilities, id, "capability");
        cap.name = revised.name;
        cap.description = revised.description;
        cap.domain = revised.domain;
        cap.proficiency = revised.proficiency;
        cap.evidence_memory_ids = revised.evidence_memory_ids;
        cap.trajectory = revised.trajectory;
        result = cap;
    });
    return result;
}

Relationship SelfSchemaManager::add_relationship(Relationship draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("rel", now);
    draft.established_at = now;
    if (draft.last_interaction_at == 0) draft.last_interaction_at = now;
    update([&draft](SelfSchema& s) { s.present_self.relationships.push_back(draft); });
    return draft;
}

Value SelfSchemaManager::add_value(Value draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("val", now);
    draft.established_at = now;
    update([&draft](SelfSchema& s) { s.present_self.values.push_back(draft); });
    return draft;
}

Limitation SelfSchemaManager::add_limitation(Limitation draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("lim", now);
    draft.discovered_at = now;
    update([&draft](SelfSchema& s) { s.present_self.limitations.push_back(draft); });
    return draft;
}

Milestone SelfSchemaManager::add_milestone(Milestone draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("ms", now);
    if (draft.occurred_at == 0) draft.occurred_at = now;
    update([&draft](SelfSchema& s) { s.temporal_trajectory.past_milestones.push_back(draft); });
    return draft;
}

NarrativeChapter SelfSchemaManager::add_chapter(NarrativeChapter draft) {
    uint64_t now = clock_();
    draft.id = generate_id_at("ch", now);
    if (draft.time_span.start == 0) draft.time_span.start = now;
    update([&draft](SelfSchema& s) { s.autobiographical_narrative.chapters.push_back(draft); });
    return draft;
}

SelfSchema SelfSchemaManager::revise_narrative(const std::string& core_summary,
                                               const std::string& changes,
                                               const std::string& reason,
                                               const std::vector<std::string>& trigger_memory_ids) {
    return update([&](SelfSchema& s) {
        uint64_t now = clock_();
        auto& narrative = s.autobiographical_narrative;
        narrative.core_summary = core_summary;
        narrative.narrative_evolution.push_back({now, changes, reason, trigger_memory_ids});
        narrative.last_synthesized_at = now;
    });
}

SelfSchema SelfSchemaManager::set_current_state(AgentState state) {
    state.updated_at = clock_();
    return update([&state](SelfSchema& s) { s.present_self.current_state = state; });
}

SelfSchema SelfSchemaManager::set_present_phase(PhaseDescription phase) {
    if (phase.started_at == 0) phase.started_at = clock_();
    return update([&phase](SelfSchema& s) { s.temporal_trajectory.current_phase = phase; });
}

} // namespace engram

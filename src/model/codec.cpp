#include "codec.hpp"
#include "../errors.hpp"
#include <limits>

namespace engram {

using nlohmann::json;

// ── Field helpers ────────────────────────────────────────────

template <typename T>
static void put_opt(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <typename T>
static std::optional<T> get_opt(const json& j, const char* key) {
    if (j.contains(key) && !j.at(key).is_null()) return j.at(key).get<T>();
    return std::nullopt;
}

// Counts and timestamps. Negative values fail instead of wrapping.
template <typename T>
static T as_unsigned(const json& v, const char* key) {
    uint64_t u = 0;
    if (v.is_number_unsigned()) {
        u = v.get<uint64_t>();
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        u = static_cast<uint64_t>(v.get<int64_t>());
    } else {
        throw EngramError(ErrorCode::SchemaViolation,
                          std::string("'") + key + "' must be a non-negative integer");
    }
    if (u > std::numeric_limits<T>::max()) {
        throw EngramError(ErrorCode::SchemaViolation, std::string("'") + key + "' is out of range");
    }
    return static_cast<T>(u);
}

template <typename T>
static T get_unsigned(const json& j, const char* key, T fallback = 0) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    return as_unsigned<T>(j.at(key), key);
}

template <typename T>
static std::optional<T> get_opt_unsigned(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return as_unsigned<T>(j.at(key), key);
}

static std::vector<std::string> get_strings(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_array()) return j.at(key).get<std::vector<std::string>>();
    return {};
}

static const json& require(const json& j, const char* key, const std::string& what) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        throw EngramError(ErrorCode::SchemaViolation,
                          what + " is missing required field '" + key + "'");
    }
    return j.at(key);
}

template <typename T>
static T require_unsigned(const json& j, const char* key, const std::string& what) {
    return as_unsigned<T>(require(j, key, what), key);
}

template <typename E>
static E enum_field(const json& j, const char* key, E fallback,
                    std::optional<E> (*parse)(const std::string&)) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    std::string raw = j.at(key).get<std::string>();
    auto v = parse(raw);
    if (!v) {
        throw EngramError(ErrorCode::SchemaViolation,
                          "unknown value '" + raw + "' for '" + key + "'");
    }
    return *v;
}

// Turn library type errors into SchemaViolation.
template <typename F>
static auto decoding(const char* what, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& e) {
        throw EngramError(ErrorCode::SchemaViolation,
                          std::string(what) + " is malformed: " + e.what());
    }
}

// ── Memory ───────────────────────────────────────────────────

static void detail_to_json(json& j, const EpisodicData& ep) {
    j["event_timestamp"] = ep.event_timestamp;
    j["event_type"] = ep.event_type;
    j["participants"] = ep.participants;
    put_opt(j, "location", ep.location);
    put_opt(j, "emotional_valence", ep.emotional_valence);
    j["emotional_tags"] = ep.emotional_tags;
    put_opt(j, "source_conversation_id", ep.source_conversation_id);
    j["source_message_ids"] = ep.source_message_ids;
}

static void detail_to_json(json& j, const SemanticData& sem) {
    j["domain"] = sem.domain;
    j["confidence"] = sem.confidence;
    j["source_memory_ids"] = sem.source_memory_ids;
    j["contradicts_ids"] = sem.contradicts_ids;
    put_opt(j, "valid_from", sem.valid_from);
    put_opt(j, "valid_until", sem.valid_until);
}

static void detail_to_json(json& j, const ProceduralData& proc) {
    j["skill_name"] = proc.skill_name;
    json steps = json::array();
    for (const auto& step : proc.steps) {
        json s = {{"order", step.order}, {"description", step.description}};
        put_opt(s, "command", step.command);
        put_opt(s, "expected_outcome", step.expected_outcome);
        json modes = json::array();
        for (const auto& fm : step.failure_modes) {
            modes.push_back({{"pattern", fm.pattern}, {"recovery", fm.recovery}});
        }
        s["failure_modes"] = modes;
        steps.push_back(std::move(s));
    }
    j["steps"] = steps;
    j["trigger_conditions"] = {
        {"keywords", proc.trigger_conditions.keywords},
        {"request_patterns", proc.trigger_conditions.request_patterns},
        {"required_context", proc.trigger_conditions.required_context}
    };
    j["success_count"] = proc.success_count;
    j["failure_count"] = proc.failure_count;
    put_opt(j, "last_success", proc.last_success);
    put_opt(j, "last_failure", proc.last_failure);
    put_opt(j, "avg_duration_ms", proc.avg_duration_ms);
}

json memory_to_json(const Memory& memory) {
    json j = {
        {"id", memory.id},
        {"type", memory_type_to_string(memory.type())},
        {"content", memory.content},
        {"importance", importance_to_string(memory.importance)},
        {"tags", memory.tags},
        {"created_at", memory.created_at},
        {"access_count", memory.access_count},
        {"is_consolidated", memory.is_consolidated},
        {"is_archived", memory.is_archived},
        {"schema_version", memory.schema_version}
    };
    put_opt(j, "context", memory.context);
    put_opt(j, "embedding", memory.embedding);
    put_opt(j, "last_accessed", memory.last_accessed);
    std::visit([&j](const auto& d) { detail_to_json(j, d); }, memory.detail);
    return j;
}

static EpisodicData episodic_from_json(const json& j) {
    EpisodicData ep;
    ep.event_type = require(j, "event_type", "episodic memory").get<std::string>();
    ep.event_timestamp = get_unsigned<uint64_t>(j, "event_timestamp");
    ep.participants = get_strings(j, "participants");
    ep.location = get_opt<std::string>(j, "location");
    ep.emotional_valence = get_opt<double>(j, "emotional_valence");
    ep.emotional_tags = get_strings(j, "emotional_tags");
    ep.source_conversation_id = get_opt<std::string>(j, "source_conversation_id");
    ep.source_message_ids = get_strings(j, "source_message_ids");
    return ep;
}

static SemanticData semantic_from_json(const json& j) {
    SemanticData sem;
    sem.domain = require(j, "domain", "semantic memory").get<std::string>();
    sem.confidence = j.value("confidence", 1.0);
    sem.source_memory_ids = get_strings(j, "source_memory_ids");
    sem.contradicts_ids = get_strings(j, "contradicts_ids");
    sem.valid_from = get_opt_unsigned<uint64_t>(j, "valid_from");
    sem.valid_until = get_opt_unsigned<uint64_t>(j, "valid_until");
    return sem;
}

static ProceduralData procedural_from_json(const json& j) {
    ProceduralData proc;
    proc.skill_name = require(j, "skill_name", "procedural memory").get<std::string>();
    const auto& steps = require(j, "steps", "procedural memory");
    if (!steps.is_array()) {
        throw EngramError(ErrorCode::SchemaViolation, "procedural memory 'steps' must be an array");
    }
    for (const auto& s : steps) {
        ProceduralStep step;
        step.order = require_unsigned<uint32_t>(s, "order", "procedural step");
        step.description = s.value("description", "");
        step.command = get_opt<std::string>(s, "command");
        step.expected_outcome = get_opt<std::string>(s, "expected_outcome");
        if (s.contains("failure_modes") && s["failure_modes"].is_array()) {
            for (const auto& fm : s["failure_modes"]) {
                step.failure_modes.push_back({fm.value("pattern", ""), fm.value("recovery", "")});
            }
        }
        proc.steps.push_back(std::move(step));
    }
    if (j.contains("trigger_conditions") && j["trigger_conditions"].is_object()) {
        const auto& tc = j["trigger_conditions"];
        proc.trigger_conditions.keywords = get_strings(tc, "keywords");
        proc.trigger_conditions.request_patterns = get_strings(tc, "request_patterns");
        if (tc.contains("required_context") && tc["required_context"].is_object()) {
            proc.trigger_conditions.required_context =
                tc["required_context"].get<std::map<std::string, std::string>>();
        }
    }
    proc.success_count = get_unsigned<uint32_t>(j, "success_count");
    proc.failure_count = get_unsigned<uint32_t>(j, "failure_count");
    proc.last_success = get_opt_unsigned<uint64_t>(j, "last_success");
    proc.last_failure = get_opt_unsigned<uint64_t>(j, "last_failure");
    proc.avg_duration_ms = get_opt<double>(j, "avg_duration_ms");
    return proc;
}

Memory memory_from_json(const json& j) {
    return decoding("memory", [&j]() {
        Memory m;
        std::string type_str = require(j, "type", "memory").get<std::string>();
        auto type = memory_type_from_string(type_str);
        if (!type) {
            throw EngramError(ErrorCode::SchemaViolation, "unknown memory type '" + type_str + "'");
        }
        m.id = j.value("id", "");
        m.content = require(j, "content", "memory").get<std::string>();
        m.context = get_opt<std::string>(j, "context");
        m.importance = enum_field(j, "importance", Importance::Normal, importance_from_string);
        m.tags = get_strings(j, "tags");
        m.embedding = get_opt<std::vector<float>>(j, "embedding");
        m.created_at = get_unsigned<uint64_t>(j, "created_at");
        m.access_count = get_unsigned<uint32_t>(j, "access_count");
        m.last_accessed = get_opt_unsigned<uint64_t>(j, "last_accessed");
        m.is_consolidated = j.value("is_consolidated", false);
        m.is_archived = j.value("is_archived", false);
        m.schema_version = j.value("schema_version", CURRENT_SCHEMA_VERSION);
        switch (*type) {
            case MemoryType::Episodic:   m.detail = episodic_from_json(j); break;
            case MemoryType::Semantic:   m.detail = semantic_from_json(j); break;
            case MemoryType::Procedural: m.detail = procedural_from_json(j); break;
        }
        return m;
    });
}

// ── Retrieval context ────────────────────────────────────────

json retrieval_context_to_json(const RetrievalContext& ctx) {
    json j = {{"trigger", retrieval_trigger_to_string(ctx.trigger)}};
    put_opt(j, "query", ctx.query);
    put_opt(j, "conversation_id", ctx.conversation_id);
    put_opt(j, "task_context", ctx.task_context);
    put_opt(j, "emotional_state", ctx.emotional_state);
    return j;
}

RetrievalContext retrieval_context_from_json(const json& j) {
    return decoding("retrieval context", [&j]() {
        RetrievalContext ctx;
        ctx.trigger = enum_field(j, "trigger", RetrievalTrigger::ExplicitRecall,
                                 retrieval_trigger_from_string);
        ctx.query = get_opt<std::string>(j, "query");
        ctx.conversation_id = get_opt<std::string>(j, "conversation_id");
        ctx.task_context = get_opt<std::string>(j, "task_context");
        ctx.emotional_state = get_opt<std::string>(j, "emotional_state");
        return ctx;
    });
}

// ── Provenance ───────────────────────────────────────────────

static json payload_json(const CreatedEvent& e) {
    return {{"source", creation_source_to_string(e.source)},
            {"original_content", e.original_content},
            {"initial_importance", importance_to_string(e.initial_importance)}};
}

static json payload_json(const AccessedEvent& e) {
    return {{"context", retrieval_context_to_json(e.context)},
            {"triggered_reconsolidation", e.triggered_reconsolidation}};
}

static json payload_json(const ModifiedEvent& e) {
    json changes = json::array();
    for (const auto& c : e.changes) {
        changes.push_back({{"field", c.field}, {"old_value", c.old_value}, {"new_value", c.new_value}});
    }
    return {{"changes", changes}, {"reason", e.reason}};
}

static json payload_json(const ReconsolidatedEvent& e) {
    return {{"reconsolidation_event_id", e.reconsolidation_event_id},
            {"change_summary", e.change_summary}};
}

static json payload_json(const LinkedEvent& e) {
    return {{"other_memory_id", e.other_memory_id},
            {"link_type", link_type_to_string(e.link_type)}};
}

static json payload_json(const UnlinkedEvent& e) {
    return {{"other_memory_id", e.other_memory_id},
            {"link_type", link_type_to_string(e.link_type)}};
}

static json payload_json(const ImportanceChangedEvent& e) {
    return {{"previous", importance_to_string(e.previous)},
            {"new", importance_to_string(e.current)},
            {"reason", e.reason}};
}

static json payload_json(const ConsolidatedEvent& e) { return {{"details", e.details}}; }
static json payload_json(const ArchivedEvent& e) { return {{"details", e.details}}; }
static json payload_json(const RestoredEvent& e) { return {{"details", e.details}}; }

json provenance_payload_to_json(const ProvenancePayload& payload) {
    return std::visit([](const auto& e) { return payload_json(e); }, payload);
}

static ProvenancePayload payload_from_json(ProvenanceEventType type, const json& d) {
    switch (type) {
        case ProvenanceEventType::Created: {
            CreatedEvent e;
            e.source = enum_field(d, "source", CreationSource::UserInput, creation_source_from_string);
            e.original_content = d.value("original_content", "");
            e.initial_importance = enum_field(d, "initial_importance", Importance::Normal,
                                              importance_from_string);
            return e;
        }
        case ProvenanceEventType::Accessed: {
            AccessedEvent e;
            if (d.contains("context")) e.context = retrieval_context_from_json(d["context"]);
            e.triggered_reconsolidation = d.value("triggered_reconsolidation", false);
            return e;
        }
        case ProvenanceEventType::Modified: {
            ModifiedEvent e;
            if (d.contains("changes") && d["changes"].is_array()) {
                for (const auto& c : d["changes"]) {
                    e.changes.push_back({c.value("field", ""),
                                         c.contains("old_value") ? c["old_value"] : json(),
                                         c.contains("new_value") ? c["new_value"] : json()});
                }
            }
            e.reason = d.value("reason", "");
            return e;
        }
        case ProvenanceEventType::Reconsolidated: {
            ReconsolidatedEvent e;
            e.reconsolidation_event_id =
                require(d, "reconsolidation_event_id", "reconsolidated entry").get<std::string>();
            e.change_summary = d.value("change_summary", "");
            return e;
        }
        case ProvenanceEventType::Linked: {
            LinkedEvent e;
            e.other_memory_id = require(d, "other_memory_id", "linked entry").get<std::string>();
            e.link_type = enum_field(d, "link_type", LinkType::RelatedTo, link_type_from_string);
            return e;
        }
        case ProvenanceEventType::Unlinked: {
            UnlinkedEvent e;
            e.other_memory_id = require(d, "other_memory_id", "unlinked entry").get<std::string>();
            e.link_type = enum_field(d, "link_type", LinkType::RelatedTo, link_type_from_string);
            return e;
        }
        case ProvenanceEventType::ImportanceChanged: {
            ImportanceChangedEvent e;
            e.previous = enum_field(d, "previous", Importance::Normal, importance_from_string);
            e.current = enum_field(d, "new", Importance::Normal, importance_from_string);
            e.reason = d.value("reason", "");
            return e;
        }
        case ProvenanceEventType::Consolidated:
            return ConsolidatedEvent{d.value("details", "")};
        case ProvenanceEventType::Archived:
            return ArchivedEvent{d.value("details", "")};
        case ProvenanceEventType::Restored:
            return RestoredEvent{d.value("details", "")};
    }
    throw EngramError(ErrorCode::SchemaViolation, "unhandled provenance event type");
}

json provenance_entry_to_json(const ProvenanceEntry& entry) {
    json j = {
        {"id", entry.id},
        {"memory_id", entry.memory_id},
        {"event_type", provenance_event_type_to_string(entry.event_type())},
        {"data", provenance_payload_to_json(entry.payload)},
        {"created_at", entry.created_at}
    };
    put_opt(j, "session_id", entry.session_id);
    put_opt(j, "agent_version", entry.agent_version);
    return j;
}

ProvenanceEntry provenance_entry_from_json(const json& j) {
    return decoding("provenance entry", [&j]() {
        ProvenanceEntry entry;
        entry.id = j.value("id", "");
        entry.memory_id = require(j, "memory_id", "provenance entry").get<std::string>();
        std::string type_str = require(j, "event_type", "provenance entry").get<std::string>();
        auto type = provenance_event_type_from_string(type_str);
        if (!type) {
            throw EngramError(ErrorCode::SchemaViolation,
                              "unknown provenance event type '" + type_str + "'");
        }
        json data = j.contains("data") && j["data"].is_object() ? j["data"] : json::object();
        entry.payload = payload_from_json(*type, data);
        entry.session_id = get_opt<std::string>(j, "session_id");
        entry.agent_version = get_opt<std::string>(j, "agent_version");
        entry.created_at = get_unsigned<uint64_t>(j, "created_at");
        return entry;
    });
}

// ── Reconsolidation events ───────────────────────────────────

json reconsolidation_event_to_json(const ReconsolidationEvent& event) {
    json updates = json::array();
    for (const auto& u : event.updates_applied) {
        updates.push_back({{"field", u.field},
                           {"previous_value", u.previous_value},
                           {"new_value", u.new_value},
                           {"reason", u.reason},
                           {"timestamp", u.timestamp}});
    }
    json j = {
        {"id", event.id},
        {"memory_id", event.memory_id},
        {"lability_window_start", event.lability_window_start},
        {"lability_window_end", nullptr},
        {"trigger_context", retrieval_context_to_json(event.trigger_context)},
        {"updates_applied", updates},
        {"final_state", nullptr}
    };
    if (event.lability_window_end) j["lability_window_end"] = *event.lability_window_end;
    if (event.final_state) j["final_state"] = final_state_to_string(*event.final_state);
    return j;
}

ReconsolidationEvent reconsolidation_event_from_json(const json& j) {
    return decoding("reconsolidation event", [&j]() {
        ReconsolidationEvent event;
        event.id = require(j, "id", "reconsolidation event").get<std::string>();
        event.memory_id = require(j, "memory_id", "reconsolidation event").get<std::string>();
        event.lability_window_start =
            require_unsigned<uint64_t>(j, "lability_window_start", "reconsolidation event");
        event.lability_window_end = get_opt_unsigned<uint64_t>(j, "lability_window_end");
        if (j.contains("trigger_context") && j["trigger_context"].is_object())
            event.trigger_context = retrieval_context_from_json(j["trigger_context"]);
        if (j.contains("updates_applied") && j["updates_applied"].is_array()) {
            for (const auto& u : j["updates_applied"]) {
                AppliedUpdate upd;
                upd.field = u.value("field", "");
                upd.previous_value = u.contains("previous_value") ? u["previous_value"] : json();
                upd.new_value = u.contains("new_value") ? u["new_value"] : json();
                upd.reason = u.value("reason", "");
                upd.timestamp = get_unsigned<uint64_t>(u, "timestamp");
                event.updates_applied.push_back(std::move(upd));
            }
        }
        if (j.contains("final_state") && j["final_state"].is_string())
            event.final_state = enum_field(j, "final_state", FinalState::Unchanged,
                                           final_state_from_string);
        return event;
    });
}

// ── Links ────────────────────────────────────────────────────

json link_to_json(const MemoryLink& link) {
    return {{"from_id", link.from_id},
            {"to_id", link.to_id},
            {"type", link_type_to_string(link.type)},
            {"created_at", link.created_at}};
}

MemoryLink link_from_json(const json& j) {
    return decoding("memory link", [&j]() {
        MemoryLink link;
        link.from_id = require(j, "from_id", "memory link").get<std::string>();
        link.to_id = require(j, "to_id", "memory link").get<std::string>();
        link.type = enum_field(j, "type", LinkType::RelatedTo, link_type_from_string);
        link.created_at = get_unsigned<uint64_t>(j, "created_at");
        return link;
    });
}

// ── Self-schema ──────────────────────────────────────────────

static json present_self_to_json(const PresentSelf& p) {
    json identity = json::array();
    for (const auto& s : p.identity_statements) {
        identity.push_back({{"id", s.id}, {"statement", s.statement},
                            {"centrality", s.centrality}, {"confidence", s.confidence},
                            {"source_memory_ids", s.source_memory_ids},
                            {"established_at", s.established_at},
                            {"last_reinforced_at", s.last_reinforced_at}});
    }
    json caps = json::array();
    for (const auto& c : p.capabilities) {
        caps.push_back({{"id", c.id}, {"name", c.name}, {"description", c.description},
                        {"domain", c.domain}, {"proficiency", c.proficiency},
                        {"evidence_memory_ids", c.evidence_memory_ids},
                        {"recognized_at", c.recognized_at},
                        {"trajectory", trajectory_to_string(c.trajectory)}});
    }
    json rels = json::array();
    for (const auto& r : p.relationships) {
        rels.push_back({{"id", r.id}, {"entity_id", r.entity_id},
                        {"entity_type", entity_type_to_string(r.entity_type)},
                        {"nature", r.nature}, {"strength", r.strength},
                        {"key_memory_ids", r.key_memory_ids},
                        {"history_summary", r.history_summary},
                        {"established_at", r.established_at},
                        {"last_interaction_at", r.last_interaction_at}});
    }
    json values = json::array();
    for (const auto& v : p.values) {
        values.push_back({{"id", v.id}, {"statement", v.statement}, {"importance", v.importance},
                          {"examples", v.examples}, {"established_at", v.established_at}});
    }
    json lims = json::array();
    for (const auto& l : p.limitations) {
        lims.push_back({{"id", l.id}, {"description", l.description},
                        {"type", limitation_type_to_string(l.type)},
                        {"discovery_context", l.discovery_context},
                        {"discovered_at", l.discovered_at}});
    }
    const auto& st = p.current_state;
    return {
        {"identity_statements", identity},
        {"capabilities", caps},
        {"relationships", rels},
        {"current_state", {{"mood", st.mood}, {"energy_level", st.energy_level},
                           {"current_focus", st.current_focus},
                           {"active_concerns", st.active_concerns},
                           {"updated_at", st.updated_at}}},
        {"values", values},
        {"limitations", lims}
    };
}

static PresentSelf present_self_from_json(const json& j) {
    PresentSelf p;
    for (const auto& s : j.value("identity_statements", json::array())) {
        IdentityStatement is;
        is.id = s.value("id", "");
        is.statement = s.value("statement", "");
        is.centrality = s.value("centrality", 0.5);
        is.confidence = s.value("confidence", 0.5);
        is.source_memory_ids = get_strings(s, "source_memory_ids");
        is.established_at = get_unsigned<uint64_t>(s, "established_at");
        is.last_reinforced_at = get_unsigned<uint64_t>(s, "last_reinforced_at");
        p.identity_statements.push_back(std::move(is));
    }
    for (const auto& c : j.value("capabilities", json::array())) {
        Capability cap;
        cap.id = c.value("id", "");
        cap.name = c.value("name", "");
        cap.description = c.value("description", "");
        cap.domain = c.value("domain", "");
        cap.proficiency = c.value("proficiency", 0.5);
        cap.evidence_memory_ids = get_strings(c, "evidence_memory_ids");
        cap.recognized_at = get_unsigned<uint64_t>(c, "recognized_at");
        cap.trajectory = enum_field(c, "trajectory", Trajectory::Stable, trajectory_from_string);
        p.capabilities.push_back(std::move(cap));
    }
    for (const auto& r : j.value("relationships", json::array())) {
        Relationship rel;
        rel.id = r.value("id", "");
        rel.entity_id = r.value("entity_id", "");
        rel.entity_type = enum_field(r, "entity_type", EntityType::User, entity_type_from_string);
        rel.nature = r.value("nature", "");
        rel.strength = r.value("strength", 0.5);
        rel.key_memory_ids = get_strings(r, "key_memory_ids");
        rel.history_summary = r.value("history_summary", "");
        rel.established_at = get_unsigned<uint64_t>(r, "established_at");
        rel.last_interaction_at = get_unsigned<uint64_t>(r, "last_interaction_at");
        p.relationships.push_back(std::move(rel));
    }
    if (j.contains("current_state") && j["current_state"].is_object()) {
        const auto& st = j["current_state"];
        p.current_state.mood = st.value("mood", "");
        p.current_state.energy_level = st.value("energy_level", 0.5);
        p.current_state.current_focus = st.value("current_focus", "");
        p.current_state.active_concerns = get_strings(st, "active_concerns");
        p.current_state.updated_at = get_unsigned<uint64_t>(st, "updated_at");
    }
    for (const auto& v : j.value("values", json::array())) {
        Value val;
        val.id = v.value("id", "");
        val.statement = v.value("statement", "");
        val.importance = v.value("importance", 5);
        val.examples = get_strings(v, "examples");
        val.established_at = get_unsigned<uint64_t>(v, "established_at");
        p.values.push_back(std::move(val));
    }
    for (const auto& l : j.value("limitations", json::array())) {
        Limitation lim;
        lim.id = l.value("id", "");
        lim.description = l.value("description", "");
        lim.type = enum_field(l, "type", LimitationType::Knowledge, limitation_type_from_string);
        lim.discovery_context = l.value("discovery_context", "");
        lim.discovered_at = get_unsigned<uint64_t>(l, "discovered_at");
        p.limitations.push_back(std::move(lim));
    }
    return p;
}

static json trajectory_to_json(const TemporalTrajectory& t) {
    json milestones = json::array();
    for (const auto& m : t.past_milestones) {
        milestones.push_back({{"id", m.id}, {"title", m.title}, {"description", m.description},
                              {"occurred_at", m.occurred_at}, {"significance", m.significance},
                              {"impact", m.impact}, {"related_memory_ids", m.related_memory_ids},
                              {"category", milestone_category_to_string(m.category)}});
    }
    json futures = json::array();
    for (const auto& f : t.anticipated_futures) {
        futures.push_back({{"id", f.id}, {"description", f.description},
                           {"horizon", horizon_to_string(f.horizon)},
                           {"likelihood", f.likelihood},
                           {"desirability", desirability_to_string(f.desirability)},
                           {"prerequisites", f.prerequisites}});
    }
    json patterns = json::array();
    for (const auto& p : t.patterns) {
        patterns.push_back({{"id", p.id}, {"name", p.name}, {"description", p.description},
                            {"instances", p.instances}, {"confidence", p.confidence}});
    }
    const auto& ph = t.current_phase;
    return {
        {"past_milestones", milestones},
        {"current_phase", {{"name", ph.name}, {"description", ph.description},
                           {"started_at", ph.started_at}, {"themes", ph.themes},
                           {"active_goals", ph.active_goals}}},
        {"anticipated_futures", futures},
        {"patterns", patterns}
    };
}

static TemporalTrajectory trajectory_from_json(const json& j) {
    TemporalTrajectory t;
    for (const auto& m : j.value("past_milestones", json::array())) {
        Milestone ms;
        ms.id = m.value("id", "");
        ms.title = m.value("title", "");
        ms.description = m.value("description", "");
        ms.occurred_at = get_unsigned<uint64_t>(m, "occurred_at");
        ms.significance = m.value("significance", 5);
        ms.impact = m.value("impact", "");
        ms.related_memory_ids = get_strings(m, "related_memory_ids");
        ms.category = enum_field(m, "category", MilestoneCategory::Learning,
                                 milestone_category_from_string);
        t.past_milestones.push_back(std::move(ms));
    }
    if (j.contains("current_phase") && j["current_phase"].is_object()) {
        const auto& ph = j["current_phase"];
        t.current_phase.name = ph.value("name", "");
        t.current_phase.description = ph.value("description", "");
        t.current_phase.started_at = get_unsigned<uint64_t>(ph, "started_at");
        t.current_phase.themes = get_strings(ph, "themes");
        t.current_phase.active_goals = get_strings(ph, "active_goals");
    }
    for (const auto& f : j.value("anticipated_futures", json::array())) {
        FutureAnticipation fa;
        fa.id = f.value("id", "");
        fa.description = f.value("description", "");
        fa.horizon = enum_field(f, "horizon", Horizon::Near, horizon_from_string);
        fa.likelihood = f.value("likelihood", 0.5);
        fa.desirability = enum_field(f, "desirability", Desirability::Neutral,
                                     desirability_from_string);
        fa.prerequisites = get_strings(f, "prerequisites");
        t.anticipated_futures.push_back(std::move(fa));
    }
    for (const auto& p : j.value("patterns", json::array())) {
        TrajectoryPattern tp;
        tp.id = p.value("id", "");
        tp.name = p.value("name", "");
        tp.description = p.value("description", "");
        tp.instances = get_strings(p, "instances");
        tp.confidence = p.value("confidence", 0.5);
        t.patterns.push_back(std::move(tp));
    }
    return t;
}

static json narrative_to_json(const AutobiographicalNarrative& n) {
    json chapters = json::array();
    for (const auto& ch : n.chapters) {
        json span = {{"start", ch.time_span.start}};
        put_opt(span, "end", ch.time_span.end);
        chapters.push_back({{"id", ch.id}, {"title", ch.title}, {"narrative", ch.narrative},
                            {"time_span", span}, {"source_memory_ids", ch.source_memory_ids},
                            {"emotional_arc", ch.emotional_arc}});
    }
    json themes = json::array();
    for (const auto& th : n.themes) {
        themes.push_back({{"id", th.id}, {"name", th.name}, {"manifestation", th.manifestation},
                          {"chapter_ids", th.chapter_ids}, {"centrality", th.centrality}});
    }
    json revisions = json::array();
    for (const auto& r : n.narrative_evolution) {
        revisions.push_back({{"revised_at", r.revised_at}, {"changes", r.changes},
                             {"reason", r.reason}, {"trigger_memory_ids", r.trigger_memory_ids}});
    }
    return {
        {"core_summary", n.core_summary},
        {"chapters", chapters},
        {"themes", themes},
        {"narrative_evolution", revisions},
        {"last_synthesized_at", n.last_synthesized_at}
    };
}

static AutobiographicalNarrative narrative_from_json(const json& j) {
    AutobiographicalNarrative n;
    n.core_summary = j.value("core_summary", "");
    for (const auto& c : j.value("chapters", json::array())) {
        NarrativeChapter ch;
        ch.id = c.value("id", "");
        ch.title = c.value("title", "");
        ch.narrative = c.value("narrative", "");
        if (c.contains("time_span") && c["time_span"].is_object()) {
            ch.time_span.start = get_unsigned<uint64_t>(c["time_span"], "start");
            ch.time_span.end = get_opt_unsigned<uint64_t>(c["time_span"], "end");
        }
        ch.source_memory_ids = get_strings(c, "source_memory_ids");
        ch.emotional_arc = c.value("emotional_arc", "");
        n.chapters.push_back(std::move(ch));
    }
    for (const auto& t : j.value("themes", json::array())) {
        NarrativeTheme th;
        th.id = t.value("id", "");
        th.name = t.value("name", "");
        th.manifestation = t.value("manifestation", "");
        th.chapter_ids = get_strings(t, "chapter_ids");
        th.centrality = t.value("centrality", 5);
        n.themes.push_back(std::move(th));
    }
    for (const auto& r : j.value("narrative_evolution", json::array())) {
        NarrativeRevision rev;
        rev.revised_at = get_unsigned<uint64_t>(r, "revised_at");
        rev.changes = r.value("changes", "");
        rev.reason = r.value("reason", "");
        rev.trigger_memory_ids = get_strings(r, "trigger_memory_ids");
        n.narrative_evolution.push_back(std::move(rev));
    }
    n.last_synthesized_at = get_unsigned<uint64_t>(j, "last_synthesized_at");
    return n;
}

json self_schema_to_json(const SelfSchema& schema) {
    return {
        {"id", schema.id},
        {"agent_id", schema.agent_id},
        {"present_self", present_self_to_json(schema.present_self)},
        {"temporal_trajectory", trajectory_to_json(schema.temporal_trajectory)},
        {"autobiographical_narrative", narrative_to_json(schema.autobiographical_narrative)},
        {"created_at", schema.created_at},
        {"updated_at", schema.updated_at},
        {"version", schema.version}
    };
}

SelfSchema self_schema_from_json(const json& j) {
    return decoding("self-schema", [&j]() {
        SelfSchema schema;
        schema.id = require(j, "id", "self-schema").get<std::string>();
        schema.agent_id = require(j, "agent_id", "self-schema").get<std::string>();
        schema.present_self = present_self_from_json(j.value("present_self", json::object()));
        schema.temporal_trajectory =
            trajectory_from_json(j.value("temporal_trajectory", json::object()));
        schema.autobiographical_narrative =
            narrative_from_json(j.value("autobiographical_narrative", json::object()));
        schema.created_at = get_unsigned<uint64_t>(j, "created_at");
        schema.updated_at = get_unsigned<uint64_t>(j, "updated_at");
        schema.version = get_unsigned<uint32_t>(j, "version", 1);
        return schema;
    });
}

// ── Session snapshots ────────────────────────────────────────

json session_snapshot_to_json(const SessionSnapshot& snapshot) {
    json j = {
        {"id", snapshot.id},
        {"name", snapshot.name},
        {"summary", snapshot.summary},
        {"decisions", snapshot.decisions},
        {"next_steps", snapshot.next_steps},
        {"files_touched", snapshot.files_touched},
        {"tags", snapshot.tags},
        {"importance", snapshot_importance_to_string(snapshot.importance)},
        {"created_at", snapshot.created_at}
    };
    put_opt(j, "project_path", snapshot.project_path);
    put_opt(j, "context", snapshot.context);
    return j;
}

SessionSnapshot session_snapshot_from_json(const json& j) {
    return decoding("session snapshot", [&j]() {
        SessionSnapshot s;
        s.id = require(j, "id", "session snapshot").get<std::string>();
        s.name = j.value("name", "");
        s.summary = j.value("summary", "");
        s.project_path = get_opt<std::string>(j, "project_path");
        s.context = get_opt<std::string>(j, "context");
        s.decisions = get_strings(j, "decisions");
        s.next_steps = get_strings(j, "next_steps");
        s.files_touched = get_strings(j, "files_touched");
        s.tags = get_strings(j, "tags");
        s.importance = enum_field(j, "importance", SnapshotImportance::Normal,
                                  snapshot_importance_from_string);
        s.created_at = get_unsigned<uint64_t>(j, "created_at");
        return s;
    });
}

} // namespace engram

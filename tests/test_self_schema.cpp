#include <catch2/catch_test_macros.hpp>
#include "model/self_schema.hpp"
#include <set>

using namespace engram;

static MemoryResolver known(std::set<std::string> ids) {
    return [ids](const std::string& id) { return ids.count(id) > 0; };
}

static SelfSchema base_schema() {
    return make_self_schema("agent_1", 1000);
}

static IdentityStatement statement(std::vector<std::string> evidence) {
    IdentityStatement s;
    s.id = "id_1";
    s.statement = "I am careful with deployments";
    s.centrality = 0.8;
    s.confidence = 0.7;
    s.source_memory_ids = std::move(evidence);
    return s;
}

// ── make_self_schema ─────────────────────────────────────────────

TEST_CASE("make_self_schema: fresh schema is empty and valid", "[self_schema]") {
    auto schema = base_schema();
    REQUIRE(schema.agent_id == "agent_1");
    REQUIRE(schema.version == 1);
    REQUIRE(schema.created_at == 1000);
    REQUIRE(schema.id.rfind("schema_", 0) == 0);
    REQUIRE(schema.present_self.identity_statements.empty());
    REQUIRE_FALSE(validate(schema, known({})).has_value());
}

// ── Evidence ─────────────────────────────────────────────────────

TEST_CASE("validate: identity statement without evidence is MissingEvidence", "[self_schema]") {
    auto schema = base_schema();
    schema.present_self.identity_statements.push_back(statement({}));
    auto err = validate(schema, known({}));
    REQUIRE(err.has_value());
    REQUIRE(err->code == ErrorCode::MissingEvidence);
}

TEST_CASE("validate: capability and chapter need evidence too", "[self_schema]") {
    auto schema = base_schema();
    Capability cap;
    cap.name = "Deploying";
    schema.present_self.capabilities.push_back(cap);
    REQUIRE(validate(schema, known({}))->code == ErrorCode::MissingEvidence);

    schema = base_schema();
    NarrativeChapter ch;
    ch.id = "ch_1";
    ch.title = "Early days";
    schema.autobiographical_narrative.chapters.push_back(ch);
    REQUIRE(validate(schema, known({}))->code == ErrorCode::MissingEvidence);
}

TEST_CASE("validate: dangling memory references are rejected", "[self_schema]") {
    auto schema = base_schema();
    schema.present_self.identity_statements.push_back(statement({"mem_a", "mem_missing"}));
    auto err = validate(schema, known({"mem_a"}));
    REQUIRE(err.has_value());
    REQUIRE(err->code == ErrorCode::ValidationError);
    REQUIRE(err->message.find("mem_missing") != std::string::npos);

    REQUIRE_FALSE(validate(schema, known({"mem_a", "mem_missing"})).has_value());
}

TEST_CASE("validate: relationships may omit memories but not cite missing ones", "[self_schema]") {
    auto schema = base_schema();
    Relationship rel;
    rel.entity_id = "user_42";
    schema.present_self.relationships.push_back(rel);
    REQUIRE_FALSE(validate(schema, known({})).has_value());

    schema.present_self.relationships[0].key_memory_ids = {"mem_gone"};
    REQUIRE(validate(schema, known({})).has_value());
}

// ── Bounds ───────────────────────────────────────────────────────

TEST_CASE("validate: unit interval bounds", "[self_schema]") {
    auto resolves = known({"mem_a"});

    auto schema = base_schema();
    schema.present_self.identity_statements.push_back(statement({"mem_a"}));
    schema.present_self.identity_statements[0].centrality = 1.2;
    REQUIRE(validate(schema, resolves)->field == "identity_statements.centrality");

    schema = base_schema();
    Capability cap;
    cap.name = "Deploying";
    cap.proficiency = -0.1;
    cap.evidence_memory_ids = {"mem_a"};
    schema.present_self.capabilities.push_back(cap);
    REQUIRE(validate(schema, resolves)->field == "capabilities.proficiency");

    schema = base_schema();
    schema.present_self.current_state.energy_level = 2.0;
    REQUIRE(validate(schema, resolves)->field == "current_state.energy_level");

    schema = base_schema();
    FutureAnticipation f;
    f.likelihood = 1.5;
    schema.temporal_trajectory.anticipated_futures.push_back(f);
    REQUIRE(validate(schema, resolves)->field == "anticipated_futures.likelihood");
}

TEST_CASE("validate: one-to-ten scales", "[self_schema]") {
    auto schema = base_schema();
    Value v;
    v.statement = "Honesty";
    v.importance = 11;
    schema.present_self.values.push_back(v);
    REQUIRE(validate(schema, known({}))->field == "values.importance");

    schema = base_schema();
    Milestone m;
    m.title = "First release";
    m.significance = 0;
    schema.temporal_trajectory.past_milestones.push_back(m);
    REQUIRE(validate(schema, known({}))->field == "past_milestones.significance");
}

// ── Narrative ────────────────────────────────────────────────────

TEST_CASE("validate: chapter time span and theme references", "[self_schema]") {
    auto resolves = known({"mem_a"});
    auto schema = base_schema();
    NarrativeChapter ch;
    ch.id = "ch_1";
    ch.title = "Early days";
    ch.source_memory_ids = {"mem_a"};
    ch.time_span.start = 100;
    ch.time_span.end = 50;
    schema.autobiographical_narrative.chapters.push_back(ch);
    REQUIRE(validate(schema, resolves)->field == "chapters.time_span");

    schema.autobiographical_narrative.chapters[0].time_span.end = 200;
    NarrativeTheme theme;
    theme.name = "Growth";
    theme.chapter_ids = {"ch_2"};
    schema.autobiographical_narrative.themes.push_back(theme);
    REQUIRE(validate(schema, resolves)->field == "themes.chapter_ids");

    schema.autobiographical_narrative.themes[0].chapter_ids = {"ch_1"};
    REQUIRE_FALSE(validate(schema, resolves).has_value());
}

// ── referenced_memory_ids ────────────────────────────────────────

TEST_CASE("referenced_memory_ids: collects each id once", "[self_schema]") {
    auto schema = base_schema();
    schema.present_self.identity_statements.push_back(statement({"mem_a", "mem_b"}));
    Milestone m;
    m.title = "Launch";
    m.related_memory_ids = {"mem_b", "mem_c"};
    schema.temporal_trajectory.past_milestones.push_back(m);

    auto ids = referenced_memory_ids(schema);
    REQUIRE(ids == std::vector<std::string>{"mem_a", "mem_b", "mem_c"});
}

// ── Enum names ───────────────────────────────────────────────────

TEST_CASE("self-schema enums: string conversion", "[self_schema]") {
    REQUIRE(trajectory_to_string(Trajectory::Improving) == "improving");
    REQUIRE(trajectory_from_string("declining") == Trajectory::Declining);
    REQUIRE_FALSE(trajectory_from_string("sideways").has_value());
}

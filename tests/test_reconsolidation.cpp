#include <catch2/catch_test_macros.hpp>
#include "reconsolidation.hpp"
#include "model/codec.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace engram;
using namespace engram_test;

static RetrievalContext context_for(RetrievalTrigger trigger) {
    RetrievalContext ctx;
    ctx.trigger = trigger;
    ctx.query = "deploy";
    return ctx;
}

struct ReconFixture : MemoryStoreFixture {
    ManualClock clock;
    ProvenanceLog log{store, clock.clock()};
    ReconsolidationEngine engine;

    explicit ReconFixture(ReconsolidationConfig config = {})
        : engine(store, log, std::move(config), clock.clock()) {}

    std::string add_semantic(const std::string& id, double confidence) {
        auto m = make_semantic("deploys need a review", "process", confidence);
        m.id = id;
        m.created_at = clock.get();
        store.create_memory(m);
        return id;
    }

    size_t count_events(const std::string& id, ProvenanceEventType type) {
        size_t n = 0;
        for (const auto& e : log.history(id)) {
            if (e.event_type() == type) ++n;
        }
        return n;
    }
};

static ReconsolidationConfig short_window(uint64_t ms) {
    ReconsolidationConfig config;
    config.lability_window_ms = ms;
    return config;
}

// ── Access and window opening ───────────────────────────────────

TEST_CASE("Reconsolidation: qualifying access opens a window", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);

    auto outcome = f.engine.record_access("mem_a", context_for(RetrievalTrigger::ExplicitRecall));
    REQUIRE(outcome.memory.access_count == 1);
    REQUIRE(outcome.memory.last_accessed == std::optional<uint64_t>(f.clock.get()));
    REQUIRE(outcome.window.has_value());
    REQUIRE(outcome.window->is_open());
    REQUIRE(outcome.window->trigger_context.query == std::optional<std::string>("deploy"));

    REQUIRE(f.store.get_memory("mem_a")->access_count == 1);
    REQUIRE(f.engine.open_window_for("mem_a").has_value());

    auto history = f.log.history("mem_a");
    REQUIRE(history.size() == 1);
    REQUIRE(std::get<AccessedEvent>(history[0].payload).triggered_reconsolidation);
}

TEST_CASE("Reconsolidation: non-qualifying trigger only counts the access", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);

    auto outcome = f.engine.record_access("mem_a", context_for(RetrievalTrigger::Associative));
    REQUIRE(outcome.memory.access_count == 1);
    REQUIRE_FALSE(outcome.window.has_value());
    REQUIRE_FALSE(f.engine.open_window_for("mem_a").has_value());
    REQUIRE_FALSE(f.engine.qualifies(RetrievalTrigger::Random));
    REQUIRE(f.engine.qualifies(RetrievalTrigger::Search));
}

TEST_CASE("Reconsolidation: access to unknown memory is NotFound", "[reconsolidation]") {
    ReconFixture f;
    try {
        f.engine.record_access("mem_missing", context_for(RetrievalTrigger::Search));
        FAIL("expected NotFound");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Reconsolidation: minimum interval between windows", "[reconsolidation]") {
    ReconsolidationConfig config;
    config.min_interval_ms = 1000;
    ReconFixture f(config);
    f.add_semantic("mem_a", 0.8);

    REQUIRE(f.engine.record_access("mem_a", context_for(RetrievalTrigger::Search)).window);
    f.clock.advance(10);
    f.engine.close_window("mem_a");

    f.clock.advance(500);
    auto early = f.engine.record_access("mem_a", context_for(RetrievalTrigger::Search));
    REQUIRE_FALSE(early.window.has_value());
    REQUIRE(early.memory.access_count == 2);

    f.clock.advance(500);
    REQUIRE(f.engine.record_access("mem_a", context_for(RetrievalTrigger::Search)).window);
}

TEST_CASE("Reconsolidation: repeated access while open keeps one window", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    auto first = f.engine.record_access("mem_a", context_for(RetrievalTrigger::Search));
    auto second = f.engine.record_access("mem_a", context_for(RetrievalTrigger::Search));
    REQUIRE(first.window.has_value());
    REQUIRE_FALSE(second.window.has_value());
    REQUIRE(second.memory.access_count == 2);
    REQUIRE(f.store.reconsolidation_events_for("mem_a").size() == 1);
}

TEST_CASE("Reconsolidation: concurrent opens yield exactly one window", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);

    std::atomic<int> opened{0};
    std::atomic<int> rejected{0};
    std::atomic<int> other{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&] {
            try {
                f.engine.open_window("mem_a", context_for(RetrievalTrigger::ExplicitRecall));
                opened++;
            } catch (const EngramError& e) {
                if (e.code() == ErrorCode::WindowAlreadyOpen) {
                    rejected++;
                } else {
                    other++;
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(opened.load() == 1);
    REQUIRE(rejected.load() == 99);
    REQUIRE(other.load() == 0);
    REQUIRE(f.store.reconsolidation_events_for("mem_a").size() == 1);
}

TEST_CASE("Reconsolidation: open_window bypasses trigger policy", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    auto event = f.engine.open_window("mem_a", context_for(RetrievalTrigger::Random));
    REQUIRE(event.is_open());
    REQUIRE(event.id.rfind("recon_", 0) == 0);
    REQUIRE(f.store.get_memory("mem_a")->access_count == 1);
}

// ── Updates ──────────────────────────────────────────────────────

TEST_CASE("Reconsolidation: update without a window is rejected", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    try {
        f.engine.apply_update("mem_a", {"content", "changed", "fix"});
        FAIL("expected NoActiveLabilityWindow");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::NoActiveLabilityWindow);
    }
    REQUIRE(f.store.get_memory("mem_a")->content == "deploys need a review");
}

TEST_CASE("Reconsolidation: immutable and foreign fields are rejected", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    for (const char* field : {"id", "created_at", "access_count", "skill_name"}) {
        try {
            f.engine.apply_update("mem_a", {field, "x", "attempt"});
            FAIL("expected ValidationError");
        } catch (const EngramError& e) {
            REQUIRE(e.code() == ErrorCode::ValidationError);
        }
    }
    REQUIRE(f.engine.open_window_for("mem_a")->updates_applied.empty());
}

TEST_CASE("Reconsolidation: out of range value fails validation", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));
    try {
        f.engine.apply_update("mem_a", {"confidence", 1.5, "overconfident"});
        FAIL("expected ValidationError");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::ValidationError);
    }
    REQUIRE(f.store.get_memory("mem_a")->confidence() == std::optional<double>(0.8));
}

TEST_CASE("Reconsolidation: content update is logged with old and new values", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    auto updated = f.engine.apply_update("mem_a", {"content", "deploys need two reviews", "policy"});
    REQUIRE(updated.content == "deploys need two reviews");
    REQUIRE(f.store.get_memory("mem_a")->content == "deploys need two reviews");

    auto window = f.engine.open_window_for("mem_a");
    REQUIRE(window->updates_applied.size() == 1);
    REQUIRE(window->updates_applied[0].previous_value == "deploys need a review");
    REQUIRE(window->updates_applied[0].new_value == "deploys need two reviews");

    REQUIRE(f.count_events("mem_a", ProvenanceEventType::Modified) == 1);
    auto closed = f.engine.close_window("mem_a");
    REQUIRE(closed.final_state == FinalState::Updated);
}

TEST_CASE("Reconsolidation: importance change is logged separately", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));
    f.engine.apply_update("mem_a", {"importance", "critical", "incident"});

    REQUIRE(f.count_events("mem_a", ProvenanceEventType::ImportanceChanged) == 1);
    auto closed = f.engine.close_window("mem_a");
    REQUIRE(closed.final_state == FinalState::Strengthened);
}

TEST_CASE("Reconsolidation: weakening below threshold archives", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.9);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    auto updated = f.engine.apply_update("mem_a", {"confidence", 0.05, "disproved"});
    REQUIRE(updated.is_archived);
    REQUIRE(f.store.get_memory("mem_a")->is_archived);
    REQUIRE(f.count_events("mem_a", ProvenanceEventType::Archived) == 1);

    auto closed = f.engine.close_window("mem_a");
    REQUIRE(closed.final_state == FinalState::Weakened);
}

TEST_CASE("Reconsolidation: weakening can be disabled", "[reconsolidation]") {
    ReconsolidationConfig config;
    config.allow_weakening = false;
    ReconFixture f(config);
    f.add_semantic("mem_a", 0.9);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    REQUIRE_THROWS_AS(f.engine.apply_update("mem_a", {"confidence", 0.5, "doubt"}), EngramError);
    REQUIRE_THROWS_AS(f.engine.apply_update("mem_a", {"importance", "low", "doubt"}), EngramError);
    f.engine.apply_update("mem_a", {"confidence", 0.95, "confirmed"});
    REQUIRE(f.store.get_memory("mem_a")->confidence() == std::optional<double>(0.95));
}

TEST_CASE("Reconsolidation: null clears an optional field", "[reconsolidation]") {
    ReconFixture f;
    auto m = make_semantic("context matters", "process", 0.8);
    m.id = "mem_ctx";
    m.context = "retro";
    m.created_at = f.clock.get();
    f.store.create_memory(m);

    f.engine.open_window("mem_ctx", context_for(RetrievalTrigger::Search));
    auto updated = f.engine.apply_update("mem_ctx", {"context", nullptr, "irrelevant"});
    REQUIRE_FALSE(updated.context.has_value());
}

TEST_CASE("Reconsolidation: null on a required field is rejected", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.3);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    for (const char* field : {"confidence", "importance", "content", "domain", "tags"}) {
        try {
            f.engine.apply_update("mem_a", {field, nullptr, "wipe"});
            FAIL("expected ValidationError");
        } catch (const EngramError& e) {
            REQUIRE(e.code() == ErrorCode::ValidationError);
        }
    }

    auto stored = f.store.get_memory("mem_a");
    REQUIRE(stored->confidence() == std::optional<double>(0.3));
    REQUIRE(stored->importance == Importance::Normal);
    REQUIRE(f.count_events("mem_a", ProvenanceEventType::Modified) == 0);
    REQUIRE(f.engine.open_window_for("mem_a")->updates_applied.empty());
}

TEST_CASE("Reconsolidation: logged new value is the stored value", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.3);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));
    f.engine.apply_update("mem_a", {"confidence", 0.9, "confirmed twice"});
    f.engine.apply_update("mem_a", {"valid_until", nullptr, "no expiry"});

    auto history = f.log.history("mem_a");
    std::vector<FieldChange> changes;
    for (const auto& e : history) {
        if (auto* modified = std::get_if<ModifiedEvent>(&e.payload)) {
            changes.insert(changes.end(), modified->changes.begin(), modified->changes.end());
        }
    }
    REQUIRE(changes.size() == 2);
    REQUIRE(changes[0].new_value == nlohmann::json(0.9));
    REQUIRE(changes[0].new_value == memory_to_json(*f.store.get_memory("mem_a"))["confidence"]);
    REQUIRE(changes[1].new_value.is_null());

    auto closed = f.engine.close_window("mem_a");
    REQUIRE(closed.final_state == FinalState::Strengthened);
}

TEST_CASE("Reconsolidation: derivation references must resolve", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    f.add_semantic("mem_src", 0.8);
    auto archived = f.store.get_memory("mem_src");
    archived->is_archived = true;
    f.store.update_memory(*archived);
    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    for (const char* field : {"source_memory_ids", "contradicts_ids"}) {
        try {
            f.engine.apply_update("mem_a", {field, nlohmann::json::array({"mem_missing"}), "cite"});
            FAIL("expected ValidationError");
        } catch (const EngramError& e) {
            REQUIRE(e.code() == ErrorCode::ValidationError);
            REQUIRE(std::string(e.what()).find("mem_missing") != std::string::npos);
        }
    }

    auto updated = f.engine.apply_update(
        "mem_a", {"source_memory_ids", nlohmann::json::array({"mem_src"}), "cite"});
    REQUIRE(std::get<SemanticData>(updated.detail).source_memory_ids ==
            std::vector<std::string>{"mem_src"});
}

// ── Closing ──────────────────────────────────────────────────────

TEST_CASE("Reconsolidation: close without a window is rejected", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    REQUIRE_THROWS_AS(f.engine.close_window("mem_a"), EngramError);
}

TEST_CASE("Reconsolidation: explicit close with no updates is unchanged", "[reconsolidation]") {
    ReconFixture f;
    f.add_semantic("mem_a", 0.8);
    auto opened = f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));
    f.clock.advance(1234);
    auto closed = f.engine.close_window("mem_a");

    REQUIRE(closed.id == opened.id);
    REQUIRE(closed.lability_window_end == std::optional<uint64_t>(opened.lability_window_start + 1234));
    REQUIRE(closed.final_state == FinalState::Unchanged);
    REQUIRE_FALSE(f.engine.open_window_for("mem_a").has_value());

    auto stored = f.store.reconsolidation_events_for("mem_a");
    REQUIRE(stored.size() == 1);
    REQUIRE_FALSE(stored[0].is_open());
    REQUIRE(f.count_events("mem_a", ProvenanceEventType::Reconsolidated) == 1);
}

TEST_CASE("Reconsolidation: window closes itself on timeout", "[reconsolidation]") {
    ReconFixture f(short_window(100));
    f.add_semantic("mem_a", 0.8);
    REQUIRE(f.engine.record_access("mem_a", context_for(RetrievalTrigger::ExplicitRecall)).window);

    f.engine.apply_update("mem_a", {"tags", nlohmann::json::array({"ops"}), "tagging"});
    f.engine.apply_update("mem_a", {"domain", "operations", "rename"});

    REQUIRE(wait_until([&f] { return !f.engine.open_window_for("mem_a").has_value(); }));

    auto events = f.store.reconsolidation_events_for("mem_a");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].lability_window_end.has_value());
    REQUIRE(events[0].updates_applied.size() == 2);
    REQUIRE(events[0].final_state == FinalState::Updated);
    REQUIRE(f.count_events("mem_a", ProvenanceEventType::Reconsolidated) == 1);

    try {
        f.engine.apply_update("mem_a", {"content", "late", "too late"});
        FAIL("expected NoActiveLabilityWindow");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::NoActiveLabilityWindow);
    }
}

TEST_CASE("Reconsolidation: only open windows stay resident", "[reconsolidation]") {
    ReconFixture f(short_window(300));
    f.add_semantic("mem_a", 0.8);
    f.add_semantic("mem_b", 0.8);

    f.engine.record_access("mem_a", context_for(RetrievalTrigger::Associative));
    REQUIRE(f.engine.resident_slots() == 0);

    f.engine.open_window("mem_a", context_for(RetrievalTrigger::Search));
    f.engine.open_window("mem_b", context_for(RetrievalTrigger::Search));
    REQUIRE(f.engine.resident_slots() == 2);

    f.engine.close_window("mem_a");
    REQUIRE(f.engine.resident_slots() == 1);
    REQUIRE(wait_until([&f] { return f.engine.resident_slots() == 0; }));
    REQUIRE(f.count_events("mem_b", ProvenanceEventType::Reconsolidated) == 1);

    // Window history is reloaded from the store.
    auto again = f.engine.record_access("mem_a", context_for(RetrievalTrigger::ExplicitRecall));
    REQUIRE_FALSE(again.window.has_value());
}

TEST_CASE("Reconsolidation: failed close keeps the window open", "[reconsolidation]") {
    MemoryStoreFixture base;
    FailingStore store(base.store);
    ManualClock clock;
    ProvenanceLog log(store, clock.clock());
    ReconsolidationEngine engine(store, log, ReconsolidationConfig{}, clock.clock());

    auto m = make_semantic("fact", "general", 0.5);
    m.id = "mem_a";
    m.created_at = clock.get();
    store.create_memory(m);
    engine.open_window("mem_a", context_for(RetrievalTrigger::Search));

    store.fail_append = true;
    try {
        engine.close_window("mem_a");
        FAIL("expected StorageFailure");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::StorageFailure);
    }
    REQUIRE(engine.open_window_for("mem_a").has_value());

    store.fail_append = false;
    auto closed = engine.close_window("mem_a");
    REQUIRE_FALSE(closed.is_open());
    REQUIRE_FALSE(engine.open_window_for("mem_a").has_value());
}

TEST_CASE("Reconsolidation: stale window from an earlier run is closed", "[reconsolidation]") {
    MemoryStoreFixture base;
    ManualClock clock;
    ProvenanceLog log(base.store, clock.clock());

    auto m = make_semantic("fact", "general", 0.5);
    m.id = "mem_a";
    m.created_at = clock.get();
    base.store.create_memory(m);

    ReconsolidationEvent stale;
    stale.id = "recon_stale";
    stale.memory_id = "mem_a";
    stale.lability_window_start = clock.get() - 10 * 60 * 1000;
    base.store.put_reconsolidation_event(stale);

    ReconsolidationEngine engine(base.store, log, ReconsolidationConfig{}, clock.clock());
    REQUIRE_FALSE(engine.open_window_for("mem_a").has_value());

    auto events = base.store.reconsolidation_events_for("mem_a");
    REQUIRE(events.size() == 1);
    REQUIRE_FALSE(events[0].is_open());
    REQUIRE(events[0].final_state == FinalState::Unchanged);
}

TEST_CASE("Reconsolidation: unexpired window from an earlier run is resumed", "[reconsolidation]") {
    MemoryStoreFixture base;
    ManualClock clock;
    ProvenanceLog log(base.store, clock.clock());

    auto m = make_semantic("fact", "general", 0.5);
    m.id = "mem_a";
    m.created_at = clock.get();
    base.store.create_memory(m);

    ReconsolidationEvent pending;
    pending.id = "recon_pending";
    pending.memory_id = "mem_a";
    pending.lability_window_start = clock.get() - 1000;
    base.store.put_reconsolidation_event(pending);

    ReconsolidationEngine engine(base.store, log, ReconsolidationConfig{}, clock.clock());
    auto open = engine.open_window_for("mem_a");
    REQUIRE(open.has_value());
    REQUIRE(open->id == "recon_pending");
    engine.apply_update("mem_a", {"content", "revised fact", "resumed"});
    REQUIRE(engine.close_window("mem_a").final_state == FinalState::Updated);
}

// ── compute_final_state ──────────────────────────────────────────

TEST_CASE("compute_final_state: importance outranks confidence", "[reconsolidation]") {
    ReconsolidationEvent event;
    REQUIRE(compute_final_state(event) == FinalState::Unchanged);

    event.updates_applied.push_back({"confidence", 0.5, 0.9, "", 1});
    REQUIRE(compute_final_state(event) == FinalState::Strengthened);

    event.updates_applied.push_back({"importance", "high", "low", "", 2});
    REQUIRE(compute_final_state(event) == FinalState::Weakened);

    ReconsolidationEvent round_trip;
    round_trip.updates_applied.push_back({"confidence", 0.5, 0.9, "", 1});
    round_trip.updates_applied.push_back({"confidence", 0.9, 0.5, "", 2});
    REQUIRE(compute_final_state(round_trip) == FinalState::Updated);
}

TEST_CASE("is_mutable_field: per-type field sets", "[reconsolidation]") {
    REQUIRE(is_mutable_field(MemoryType::Episodic, "content"));
    REQUIRE(is_mutable_field(MemoryType::Episodic, "participants"));
    REQUIRE_FALSE(is_mutable_field(MemoryType::Episodic, "event_timestamp"));
    REQUIRE(is_mutable_field(MemoryType::Semantic, "confidence"));
    REQUIRE(is_mutable_field(MemoryType::Procedural, "steps"));
    REQUIRE_FALSE(is_mutable_field(MemoryType::Procedural, "confidence"));
    REQUIRE_FALSE(is_mutable_field(MemoryType::Semantic, "is_archived"));
}

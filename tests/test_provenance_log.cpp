#include <catch2/catch_test_macros.hpp>
#include "provenance_log.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace engram;
using namespace engram_test;

struct LogFixture : MemoryStoreFixture {
    ManualClock clock;
    ProvenanceLog log{store, clock.clock(), "engram-test"};

    Memory add_semantic(const std::string& id, std::vector<std::string> sources = {}) {
        auto m = make_semantic("belief " + id, "testing", 0.7);
        m.id = id;
        m.created_at = clock.get();
        std::get<SemanticData>(m.detail).source_memory_ids = std::move(sources);
        store.create_memory(m);
        log.append(id, CreatedEvent{CreationSource::Inference, m.content, m.importance});
        return m;
    }
};

// ── append / history ─────────────────────────────────────────────

TEST_CASE("ProvenanceLog: append assigns id, timestamp and agent version", "[provenance]") {
    LogFixture f;
    auto id = f.log.append("mem_a", ArchivedEvent{"stale"}, std::string("session_9"));
    REQUIRE(id.rfind("prov_", 0) == 0);

    auto history = f.log.history("mem_a");
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].id == id);
    REQUIRE(history[0].created_at == f.clock.get());
    REQUIRE(history[0].agent_version == std::optional<std::string>("engram-test"));
    REQUIRE(history[0].session_id == std::optional<std::string>("session_9"));
    REQUIRE(history[0].event_type() == ProvenanceEventType::Archived);
}

TEST_CASE("ProvenanceLog: N appends produce N entries in order", "[provenance]") {
    LogFixture f;
    for (int i = 0; i < 20; ++i) {
        f.log.append("mem_a", ModifiedEvent{{}, "edit " + std::to_string(i)});
        if (i % 3 == 0) f.clock.advance(1);
    }
    auto history = f.log.history("mem_a");
    REQUIRE(history.size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(std::get<ModifiedEvent>(history[i].payload).reason == "edit " + std::to_string(i));
    }
}

TEST_CASE("ProvenanceLog: timestamps never go backwards", "[provenance]") {
    LogFixture f;
    f.log.append("mem_a", ConsolidatedEvent{"first"});
    auto first = f.clock.get();
    f.clock.now->store(first - 5000);
    f.log.append("mem_a", ConsolidatedEvent{"second"});

    auto history = f.log.history("mem_a");
    REQUIRE(history.size() == 2);
    REQUIRE(history[1].created_at == first);
    REQUIRE(std::get<ConsolidatedEvent>(history[1].payload).details == "second");
}

TEST_CASE("ProvenanceLog: concurrent appends are all kept", "[provenance]") {
    LogFixture f;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&f] {
            for (int i = 0; i < 25; ++i) f.log.append("mem_a", AccessedEvent{});
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(f.log.history("mem_a").size() == 100);
}

TEST_CASE("ProvenanceLog: failed append propagates", "[provenance]") {
    MemoryStoreFixture base;
    FailingStore failing(base.store);
    ManualClock clock;
    ProvenanceLog log(failing, clock.clock());
    failing.fail_append = true;
    try {
        log.append("mem_a", ArchivedEvent{});
        FAIL("expected StorageFailure");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::StorageFailure);
    }
    REQUIRE(log.history("mem_a").empty());
}

// ── trace ────────────────────────────────────────────────────────

TEST_CASE("ProvenanceLog: trace of unknown memory is NotFound", "[provenance]") {
    LogFixture f;
    try {
        f.log.trace("mem_missing", TraceOptions{});
        FAIL("expected NotFound");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::NotFound);
    }
}

TEST_CASE("ProvenanceLog: trace splits creation, changes and accesses", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_a");
    f.clock.advance(10);
    f.log.append("mem_a", AccessedEvent{});
    f.log.append("mem_a", ImportanceChangedEvent{Importance::Normal, Importance::High, "promoted"});

    TraceOptions options;
    auto trace = f.log.trace("mem_a", options);
    REQUIRE(trace.creation.has_value());
    REQUIRE(std::get<CreatedEvent>(trace.creation->payload).source == CreationSource::Inference);
    REQUIRE(trace.modifications.size() == 1);
    REQUIRE(trace.accesses.empty());
    REQUIRE(trace.derivation_chain.empty());
    REQUIRE_FALSE(trace.truncated);

    options.include_access_history = true;
    REQUIRE(f.log.trace("mem_a", options).accesses.size() == 1);
}

TEST_CASE("ProvenanceLog: trace follows sources and derives_from links", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_root");
    f.add_semantic("mem_obs");
    f.add_semantic("mem_mid", {"mem_root"});
    f.add_semantic("mem_top", {"mem_mid"});
    f.store.add_link({"mem_top", "mem_obs", LinkType::DerivesFrom, 1});
    f.store.add_link({"mem_top", "mem_root", LinkType::Supports, 1});

    auto trace = f.log.trace("mem_top", TraceOptions{});
    REQUIRE(trace.derivation_chain.size() == 3);
    REQUIRE(trace.derivation_chain[0].memory_id == "mem_mid");
    REQUIRE(trace.derivation_chain[0].via == "source_memory_ids");
    REQUIRE(trace.derivation_chain[1].memory_id == "mem_root");
    REQUIRE(trace.derivation_chain[1].parent_id == "mem_mid");
    REQUIRE(trace.derivation_chain[1].depth == 2);
    REQUIRE(trace.derivation_chain[2].memory_id == "mem_obs");
    REQUIRE(trace.derivation_chain[2].via == "derives_from");
    REQUIRE_FALSE(trace.truncated);
}

TEST_CASE("ProvenanceLog: missing source is reported unresolved", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_a", {"mem_deleted"});
    auto trace = f.log.trace("mem_a", TraceOptions{});
    REQUIRE(trace.derivation_chain.size() == 1);
    REQUIRE_FALSE(trace.derivation_chain[0].resolved);
}

TEST_CASE("ProvenanceLog: cycles terminate and mark the trace truncated", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_a", {"mem_b"});
    f.add_semantic("mem_b", {"mem_a"});

    auto trace = f.log.trace("mem_a", TraceOptions{});
    REQUIRE(trace.derivation_chain.size() == 1);
    REQUIRE(trace.derivation_chain[0].memory_id == "mem_b");
    REQUIRE(trace.truncated);
}

TEST_CASE("ProvenanceLog: depth limit cuts the walk", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_0");
    for (int i = 1; i <= 4; ++i) {
        f.add_semantic("mem_" + std::to_string(i), {"mem_" + std::to_string(i - 1)});
    }
    TraceOptions options;
    options.max_depth = 2;
    auto trace = f.log.trace("mem_4", options);
    REQUIRE(trace.derivation_chain.size() == 2);
    REQUIRE(trace.derivation_chain.back().memory_id == "mem_2");
    REQUIRE(trace.truncated);
}

TEST_CASE("ProvenanceLog: summary describes the belief", "[provenance]") {
    LogFixture f;
    f.add_semantic("mem_base");
    f.add_semantic("mem_a", {"mem_base"});
    auto trace = f.log.trace("mem_a", TraceOptions{});
    REQUIRE(trace.summary.find("Memory mem_a (semantic, normal importance") == 0);
    REQUIRE(trace.summary.find("from inference") != std::string::npos);
    REQUIRE(trace.summary.find("derives from 1 memory across 1 level.") != std::string::npos);
}

#include <catch2/catch_test_macros.hpp>
#include "export.hpp"
#include "test_helpers.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace engram;
using namespace engram_test;

struct ExportFixture : MemoryStoreFixture {
    ExportFixture() {
        for (int i = 0; i < 3; ++i) {
            auto m = make_semantic("fact " + std::to_string(i), "general", 0.5 + 0.1 * i);
            m.id = "mem_" + std::to_string(i);
            m.created_at = 1000 + static_cast<uint64_t>(i);
            m.tags = {"t" + std::to_string(i)};
            store.create_memory(m);
        }
        auto gone = make_episodic("old standup", "meeting", 500);
        gone.id = "mem_archived";
        gone.created_at = 500;
        gone.is_archived = true;
        store.create_memory(gone);

        ProvenanceEntry e;
        e.id = "prov_1";
        e.memory_id = "mem_0";
        e.payload = CreatedEvent{CreationSource::UserInput, "fact 0", Importance::Normal};
        e.created_at = 1000;
        store.append_provenance(e);

        store.add_link({"mem_1", "mem_0", LinkType::DerivesFrom, 1001});

        SessionSnapshot s;
        s.id = "snap_1";
        s.name = "wrap-up";
        s.summary = "closed the sprint";
        s.created_at = 2000;
        store.save_snapshot(s);
    }
};

static std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

// ── Snapshot and checksum ────────────────────────────────────────

TEST_CASE("Export: snapshot gathers every record, archived included", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    REQUIRE(snap.exported_at == 5000);
    REQUIRE(snap.agent_id == "agent_1");
    REQUIRE(snap.memories.size() == 4);
    REQUIRE(snap.provenance.size() == 1);
    REQUIRE(snap.links.size() == 1);
    REQUIRE(snap.snapshots.size() == 1);
    REQUIRE_FALSE(snap.self_schema.has_value());
}

TEST_CASE("Export: checksum is lowercase hex SHA-256 and deterministic", "[export]") {
    ExportFixture f;
    auto a = build_snapshot(f.store, "agent_1", 5000);
    auto b = build_snapshot(f.store, "agent_1", 5000);
    REQUIRE(a.checksum.size() == 64);
    for (char c : a.checksum) {
        REQUIRE((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f')));
    }
    REQUIRE(a.checksum == b.checksum);
    REQUIRE(canonical_serialization(a) == canonical_serialization(b));

    auto later = build_snapshot(f.store, "agent_1", 5001);
    REQUIRE(later.checksum != a.checksum);
}

TEST_CASE("Export: canonical form leaves out the checksum", "[export]") {
    MemorySystemSnapshot empty;
    auto canonical = canonical_serialization(empty);
    REQUIRE(canonical.find("\"checksum\"") == std::string::npos);
    REQUIRE(canonical.find("\"self_schema\":null") != std::string::npos);
    REQUIRE(compute_checksum(empty) == compute_checksum(empty));
}

TEST_CASE("Export: parse verifies an untouched document", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    auto parsed = parse_snapshot(snapshot_to_json(snap).dump(2));
    REQUIRE(parsed.checksum == snap.checksum);
    REQUIRE(parsed.memories.size() == 4);
    REQUIRE(parsed.snapshots[0].summary == "closed the sprint");
}

TEST_CASE("Export: tampered document fails integrity check", "[export]") {
    ExportFixture f;
    auto j = snapshot_to_json(build_snapshot(f.store, "agent_1", 5000));
    j["memories"][0]["content"] = "rewritten history";
    try {
        parse_snapshot(j.dump());
        FAIL("expected IntegrityMismatch");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::IntegrityMismatch);
    }
}

TEST_CASE("Export: restricted snapshot keeps only related records", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    auto before = snap.checksum;
    restrict_snapshot(snap, {"mem_0", "mem_2"});

    REQUIRE(snap.memories.size() == 2);
    REQUIRE(snap.provenance.size() == 1);
    REQUIRE(snap.links.empty());
    REQUIRE(snap.snapshots.size() == 1);
    REQUIRE(snap.checksum != before);
    REQUIRE(parse_snapshot(snapshot_to_json(snap).dump()).memories.size() == 2);
}

TEST_CASE("Export: malformed documents are schema violations", "[export]") {
    for (const char* doc : {"not json at all", "[1, 2, 3]", "{\"agent_id\": \"a\"}"}) {
        try {
            parse_snapshot(doc);
            FAIL("expected SchemaViolation");
        } catch (const EngramError& e) {
            REQUIRE(e.code() == ErrorCode::SchemaViolation);
        }
    }
}

// ── Import ───────────────────────────────────────────────────────

TEST_CASE("Export: import fills an empty store and skips existing records", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);

    MemoryStoreFixture target;
    auto first = import_snapshot(target.store, snap);
    REQUIRE(first.memories == 4);
    REQUIRE(first.provenance == 1);
    REQUIRE(first.links == 1);
    REQUIRE(first.snapshots == 1);
    REQUIRE_FALSE(first.self_schema);
    REQUIRE(target.store.get_memory("mem_archived")->is_archived);

    auto second = import_snapshot(target.store, snap);
    REQUIRE(second.memories == 0);
    REQUIRE(second.provenance == 0);
    REQUIRE(second.links == 0);
    REQUIRE(second.snapshots == 0);
    REQUIRE(target.store.count_memories() == 4);
}

TEST_CASE("Export: import keeps the local version of a clashing memory", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);

    MemoryStoreFixture target;
    auto local = make_semantic("local belief", "general");
    local.id = "mem_0";
    local.created_at = 1;
    target.store.create_memory(local);

    auto report = import_snapshot(target.store, snap);
    REQUIRE(report.memories == 3);
    REQUIRE(target.store.get_memory("mem_0")->content == "local belief");
}

// ── HTML ─────────────────────────────────────────────────────────

TEST_CASE("Export: HTML embeds the payload and renders the first page", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    HtmlOptions options;
    options.title = "Agent memories";
    options.page_size = 2;
    auto html = render_html(snap, options);

    REQUIRE(html.rfind("<!DOCTYPE html>", 0) == 0);
    REQUIRE(html.find("<title>Agent memories</title>") != std::string::npos);
    REQUIRE(html.find("id=\"engram-data\"") != std::string::npos);
    REQUIRE(html.find(snap.checksum) != std::string::npos);
    REQUIRE(html.find("var PAGE_SIZE=2;") != std::string::npos);
    REQUIRE(html.find("wrap-up") != std::string::npos);

    // Newest two cards are rendered; the rest live only in the payload.
    REQUIRE(html.find("<div>fact 2</div>") != std::string::npos);
    REQUIRE(html.find("<div>fact 1</div>") != std::string::npos);
    REQUIRE(html.find("<div>fact 0</div>") == std::string::npos);
    REQUIRE(html.find("<button id=\"show-more\">") != std::string::npos);
}

TEST_CASE("Export: HTML escapes content and cannot break out of the payload", "[export]") {
    MemoryStoreFixture f;
    auto m = make_semantic("</script><script>alert(1)</script>", "xss");
    m.id = "mem_x";
    m.created_at = 10;
    f.store.create_memory(m);

    auto html = render_html(build_snapshot(f.store, "agent_1", 20), HtmlOptions{});
    REQUIRE(html.find("&lt;/script&gt;&lt;script&gt;alert(1)&lt;/script&gt;") != std::string::npos);
    REQUIRE(html.find("<\\/script>") != std::string::npos);
    REQUIRE(count_of(html, "</script>") == 2);
    REQUIRE(html.find("style=\"display:none\">Show more") != std::string::npos);
}

TEST_CASE("Export: identity section is optional", "[export]") {
    ExportFixture f;
    auto schema = make_self_schema("agent_1", 100);
    schema.autobiographical_narrative.core_summary = "A careful assistant";
    f.store.put_self_schema(schema);
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    REQUIRE(snap.self_schema.has_value());

    HtmlOptions options;
    REQUIRE(render_html(snap, options).find("A careful assistant") != std::string::npos);
    options.include_identity = false;
    options.include_snapshots = false;
    auto html = render_html(snap, options);
    REQUIRE(html.find("id=\"identity\"") == std::string::npos);
    REQUIRE(html.find("id=\"snapshots\"") == std::string::npos);
}

TEST_CASE("Export: HTML header names the filter", "[export]") {
    ExportFixture f;
    auto snap = build_snapshot(f.store, "agent_1", 5000);
    REQUIRE(render_html(snap, HtmlOptions{}).find("filter <code>") == std::string::npos);

    HtmlOptions options;
    options.filter = "<fact>";
    REQUIRE(render_html(snap, options).find("filter <code>&lt;fact&gt;</code>") != std::string::npos);
}

TEST_CASE("Export: write_export writes atomically and reports failures", "[export]") {
    auto path = "/tmp/engram_test_export_" + std::to_string(getpid()) + "/out.json";
    write_export(path, "{\"ok\":true}");
    REQUIRE(read_file(path) == "{\"ok\":true}");
    std::remove(path.c_str());

    try {
        write_export("/proc/engram_no_such_dir/out.json", "x");
        FAIL("expected StorageFailure");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::StorageFailure);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "entity_id.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cctype>
#include <set>
#include <thread>
#include <vector>
#include <mutex>

using namespace engram;

// ── Format ───────────────────────────────────────────────────────

TEST_CASE("generate_id: body is time plus random characters", "[entity_id]") {
    auto id = generate_id();
    REQUIRE(id.size() == ID_TIME_CHARS + ID_RANDOM_CHARS);
    REQUIRE(id.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ") == std::string::npos);
}

TEST_CASE("generate_id: prefix is joined with an underscore", "[entity_id]") {
    auto id = generate_id("mem");
    REQUIRE(id.rfind("mem_", 0) == 0);
    REQUIRE(id.size() == 4 + ID_TIME_CHARS + ID_RANDOM_CHARS);
}

TEST_CASE("generate_id_at: encodes zero as all zeros", "[entity_id]") {
    auto id = generate_id_at("", 0);
    REQUIRE(id.substr(0, ID_TIME_CHARS) == "0000000000");
}

// ── Ordering ─────────────────────────────────────────────────────

TEST_CASE("generate_id_at: increasing timestamps sort in order", "[entity_id]") {
    uint64_t base = 1700000000000ULL;
    std::string prev = generate_id_at("mem", base);
    for (uint64_t step : {1ULL, 31ULL, 32ULL, 1000ULL, 86400000ULL}) {
        std::string next = generate_id_at("mem", base + step);
        REQUIRE(prev < next);
        prev = next;
        base += step;
    }
}

TEST_CASE("generate_id: ids are unique across threads", "[entity_id]") {
    std::set<std::string> ids;
    std::mutex mu;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            std::vector<std::string> local;
            for (int i = 0; i < 500; ++i) local.push_back(generate_id("x"));
            std::lock_guard<std::mutex> lock(mu);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto& th : threads) th.join();
    REQUIRE(ids.size() == 4000);
}

// ── timestamp_of ─────────────────────────────────────────────────

TEST_CASE("timestamp_of: decodes the embedded time", "[entity_id]") {
    uint64_t t = 1700000000123ULL;
    REQUIRE(timestamp_of(generate_id_at("prov", t)) == t);
    REQUIRE(timestamp_of(generate_id_at("", t)) == t);
}

TEST_CASE("timestamp_of: current id is within a millisecond of now", "[entity_id]") {
    uint64_t before = epoch_millis();
    auto id = generate_id("mem");
    uint64_t after = epoch_millis();
    uint64_t ts = timestamp_of(id);
    REQUIRE(ts >= before);
    REQUIRE(ts <= after);
}

TEST_CASE("timestamp_of: accepts lowercase", "[entity_id]") {
    uint64_t t = 1234567890ULL;
    std::string id = generate_id_at("mem", t);
    for (auto& c : id) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    REQUIRE(timestamp_of(id) == t);
}

TEST_CASE("timestamp_of: rejects short ids", "[entity_id]") {
    try {
        timestamp_of("mem_01ABC");
        FAIL("expected InvalidIdentifier");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("timestamp_of: rejects characters outside the alphabet", "[entity_id]") {
    // I, L, O and U are excluded from Crockford base-32
    try {
        timestamp_of("mem_01JB3Z6Q4W8N2K5T7V9XCDEFGU");
        FAIL("expected InvalidIdentifier");
    } catch (const EngramError& e) {
        REQUIRE(e.code() == ErrorCode::InvalidIdentifier);
    }
    REQUIRE_THROWS_AS(timestamp_of("!!!!!!!!!!!!"), EngramError);
}

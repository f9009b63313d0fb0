#pragma once
#include "errors.hpp"
#include "store.hpp"
#include "store/json_store.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace engram_test {

// Clock the test advances by hand.
struct ManualClock {
    std::shared_ptr<std::atomic<uint64_t>> now =
        std::make_shared<std::atomic<uint64_t>>(1700000000000ULL);

    engram::Clock clock() const {
        auto n = now;
        return [n] { return n->load(); };
    }
    void advance(uint64_t ms) { now->fetch_add(ms); }
    uint64_t get() const { return now->load(); }
};

// Open in-memory store for the lifetime of the fixture.
struct MemoryStoreFixture {
    engram::JsonStore store{""};
    MemoryStoreFixture() { store.open(); }
    ~MemoryStoreFixture() { store.close(); }
};

// Forwards to an inner store; selected writes fail on demand.
class FailingStore : public engram::Store {
public:
    explicit FailingStore(engram::Store& inner) : inner_(inner) {}

    std::atomic<bool> fail_append{false};
    std::atomic<bool> fail_event_put{false};
    std::atomic<bool> fail_update{false};

    std::string backend_name() const override { return "failing"; }
    void open() override { inner_.open(); }
    void close() override { inner_.close(); }
    bool is_open() const override { return inner_.is_open(); }

    void create_memory(const engram::Memory& m) override { inner_.create_memory(m); }
    std::optional<engram::Memory> get_memory(const std::string& id) override {
        return inner_.get_memory(id);
    }
    void update_memory(const engram::Memory& m) override {
        if (fail_update) fail("update_memory");
        inner_.update_memory(m);
    }
    std::vector<engram::Memory> query_memories(const engram::MemoryFilter& f) override {
        return inner_.query_memories(f);
    }
    uint32_t count_memories() override { return inner_.count_memories(); }

    void append_provenance(const engram::ProvenanceEntry& e) override {
        if (fail_append) fail("append_provenance");
        inner_.append_provenance(e);
    }
    std::vector<engram::ProvenanceEntry> provenance_for(const std::string& id) override {
        return inner_.provenance_for(id);
    }
    std::vector<engram::ProvenanceEntry> all_provenance() override {
        return inner_.all_provenance();
    }

    void put_reconsolidation_event(const engram::ReconsolidationEvent& e) override {
        if (fail_event_put) fail("put_reconsolidation_event");
        inner_.put_reconsolidation_event(e);
    }
    std::vector<engram::ReconsolidationEvent> reconsolidation_events_for(
        const std::string& id) override {
        return inner_.reconsolidation_events_for(id);
    }
    std::vector<engram::ReconsolidationEvent> all_reconsolidation_events() override {
        return inner_.all_reconsolidation_events();
    }

    bool add_link(const engram::MemoryLink& l) override { return inner_.add_link(l); }
    bool remove_link(const std::string& from, const std::string& to,
                     engram::LinkType type) override {
        return inner_.remove_link(from, to, type);
    }
    std::vector<engram::MemoryLink> links_from(const std::string& id) override {
        return inner_.links_from(id);
    }
    std::vector<engram::MemoryLink> all_links() override { return inner_.all_links(); }

    std::optional<engram::SelfSchema> get_self_schema(const std::string& agent) override {
        return inner_.get_self_schema(agent);
    }
    void put_self_schema(const engram::SelfSchema& s) override { inner_.put_self_schema(s); }

    void save_snapshot(const engram::SessionSnapshot& s) override { inner_.save_snapshot(s); }
    std::vector<engram::SessionSnapshot> list_snapshots(uint32_t limit) override {
        return inner_.list_snapshots(limit);
    }

private:
    [[noreturn]] static void fail(const char* what) {
        throw engram::EngramError(engram::ErrorCode::StorageFailure,
                                  std::string("injected failure in ") + what);
    }

    engram::Store& inner_;
};

// Poll until pred holds or timeout_ms passes.
inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace engram_test

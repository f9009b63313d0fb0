#pragma once
#include "model/memory.hpp"
#include "model/provenance.hpp"
#include "model/self_schema.hpp"
#include "model/session_snapshot.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct Config;

// Structural prefilter a backend applies before ranking. Text matching
// and scoring happen on top, in the retrieval engine.
struct MemoryFilter {
    std::vector<MemoryType> types;          // empty = any
    std::vector<Importance> importances;    // empty = any
    std::optional<uint64_t> created_after;  // inclusive
    std::optional<uint64_t> created_before; // inclusive
    bool include_archived = false;
};

// Abstract persistence backend. Implementations are internally
// synchronized; every failure surfaces as EngramError(StorageFailure).
// Calls on a store that is not open fail the same way.
class Store {
public:
    virtual ~Store() = default;

    virtual std::string backend_name() const = 0;

    virtual void open() = 0;
    // Must not throw. Safe to call on a closed store.
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    // Insert a new record. An existing id is a StorageFailure.
    virtual void create_memory(const Memory& memory) = 0;
    virtual std::optional<Memory> get_memory(const std::string& id) = 0;
    // Replace the stored record with the same id. NotFound if absent.
    virtual void update_memory(const Memory& memory) = 0;
    // Candidates matching the filter, newest first.
    virtual std::vector<Memory> query_memories(const MemoryFilter& filter) = 0;
    virtual uint32_t count_memories() = 0;

    // Provenance is append-only: there is no update or delete.
    virtual void append_provenance(const ProvenanceEntry& entry) = 0;
    // Entries for one memory in append order.
    virtual std::vector<ProvenanceEntry> provenance_for(const std::string& memory_id) = 0;
    virtual std::vector<ProvenanceEntry> all_provenance() = 0;

    // Insert or replace by event id.
    virtual void put_reconsolidation_event(const ReconsolidationEvent& event) = 0;
    virtual std::vector<ReconsolidationEvent> reconsolidation_events_for(
        const std::string& memory_id) = 0;
    virtual std::vector<ReconsolidationEvent> all_reconsolidation_events() = 0;

    // Returns false if the same (from, to, type) link already exists.
    virtual bool add_link(const MemoryLink& link) = 0;
    // Returns false if no such link exists.
    virtual bool remove_link(const std::string& from_id, const std::string& to_id,
                             LinkType type) = 0;
    virtual std::vector<MemoryLink> links_from(const std::string& memory_id) = 0;
    virtual std::vector<MemoryLink> all_links() = 0;

    virtual std::optional<SelfSchema> get_self_schema(const std::string& agent_id) = 0;
    virtual void put_self_schema(const SelfSchema& schema) = 0;

    virtual void save_snapshot(const SessionSnapshot& snapshot) = 0;
    // Newest first, at most `limit` (0 = all).
    virtual std::vector<SessionSnapshot> list_snapshots(uint32_t limit) = 0;
};

// Opens a store for the lifetime of the guard and closes it on every
// exit path.
class StoreSession {
public:
    explicit StoreSession(Store& store) : store_(store) { store_.open(); }
    ~StoreSession() { store_.close(); }

    StoreSession(const StoreSession&) = delete;
    StoreSession& operator=(const StoreSession&) = delete;

    Store& store() { return store_; }

private:
    Store& store_;
};

// Backend named by config.storage.backend ("sqlite" or "json"), unopened.
std::unique_ptr<Store> create_store(const Config& config);

// True if the memory's fields satisfy the filter.
bool matches_filter(const Memory& memory, const MemoryFilter& filter);

} // namespace engram

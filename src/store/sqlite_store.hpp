#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace engram {

// SQLite-backed store. Records are kept as JSON bodies beside the
// columns used for filtering. Provenance rows are protected by
// triggers that abort any UPDATE or DELETE.
class SqliteStore : public Store {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    void open() override;
    void close() override;
    bool is_open() const override;

    void create_memory(const Memory& memory) override;
    std::optional<Memory> get_memory(const std::string& id) override;
    void update_memory(const Memory& memory) override;
    std::vector<Memory> query_memories(const MemoryFilter& filter) override;
    uint32_t count_memories() override;

    void append_provenance(const ProvenanceEntry& entry) override;
    std::vector<ProvenanceEntry> provenance_for(const std::string& memory_id) override;
    std::vector<ProvenanceEntry> all_provenance() override;

    void put_reconsolidation_event(const ReconsolidationEvent& event) override;
    std::vector<ReconsolidationEvent> reconsolidation_events_for(
        const std::string& memory_id) override;
    std::vector<ReconsolidationEvent> all_reconsolidation_events() override;

    bool add_link(const MemoryLink& link) override;
    bool remove_link(const std::string& from_id, const std::string& to_id,
                     LinkType type) override;
    std::vector<MemoryLink> links_from(const std::string& memory_id) override;
    std::vector<MemoryLink> all_links() override;

    std::optional<SelfSchema> get_self_schema(const std::string& agent_id) override;
    void put_self_schema(const SelfSchema& schema) override;

    void save_snapshot(const SessionSnapshot& snapshot) override;
    std::vector<SessionSnapshot> list_snapshots(uint32_t limit) override;

private:
    void init_schema();
    void exec(const char* sql);
    void require_open() const;

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace engram

#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

// Whole-file JSON store. Every mutation rewrites the file atomically.
// An empty path keeps everything in memory; the data then survives
// close() and is visible again on the next open().
class JsonStore : public Store {
public:
    explicit JsonStore(const std::string& path);
    ~JsonStore() override = default;

    std::string backend_name() const override { return "json"; }

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
    void load();
    void save();
    void clear();
    void require_open() const;

    std::string path_;
    bool open_ = false;

    std::vector<Memory> memories_;
    std::unordered_map<std::string, size_t> memory_index_; // id -> memories_ index
    std::vector<ProvenanceEntry> provenance_;
    std::unordered_map<std::string, size_t> provenance_ids_;
    std::vector<ReconsolidationEvent> events_;
    std::vector<MemoryLink> links_;
    std::unordered_map<std::string, SelfSchema> schemas_;  // agent_id -> schema
    std::vector<SessionSnapshot> snapshots_;
    mutable std::mutex mutex_;
};

} // namespace engram

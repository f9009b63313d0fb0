#pragma once
#include "config.hpp"
#include "export.hpp"
#include "provenance_log.hpp"
#include "reconsolidation.hpp"
#include "retrieval.hpp"
#include "self_schema_manager.hpp"
#include "store.hpp"
#include "util.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Options for creating a memory.
struct CreateOptions {
    CreationSource source = CreationSource::UserInput;
    std::optional<std::string> session_id;
};

// What an export covers. The defaults give the whole system.
struct ShareOptions {
    std::optional<std::string> query;      // keep only memories matching this text
    bool with_identity = true;
    bool with_snapshots = true;
    std::optional<std::string> agent_name; // overrides export.agent_name
};

// Wires the components over one caller-owned, already open store. The
// engine holds no global state: several engines over separate stores
// can run side by side.
class MemoryEngine {
public:
    MemoryEngine(Store& store, Config config, Clock clock = system_clock());

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    // Assign id and created_at, validate, store, and log `created`.
    Memory create(Memory draft, const CreateOptions& options = {});

    // Plain read. Not an access.
    std::optional<Memory> get(const std::string& id);

    // Ranked results. Not an access.
    std::vector<Memory> query(const QueryCriteria& criteria) const;
    std::vector<ScoredMemory> rank(const QueryCriteria& criteria) const;
    BudgetSelection query_within_budget(const QueryCriteria& criteria, uint64_t budget,
                                        const CostFn& cost = default_cost) const;

    // Query, then record an access with the given context on every
    // result. Returns the memories as they are after the access.
    std::vector<AccessOutcome> recall(const QueryCriteria& criteria, const RetrievalContext& context);

    AccessOutcome access(const std::string& id, const RetrievalContext& context);

    ReconsolidationEvent open_window(const std::string& id, const RetrievalContext& context);
    Memory apply_update(const std::string& id, const FieldUpdate& update);
    ReconsolidationEvent close_window(const std::string& id);
    std::optional<ReconsolidationEvent> open_window_for(const std::string& id);

    // Structural links. Both memories must exist. Return false when the
    // link already exists (link) or is absent (unlink).
    bool link(const std::string& from_id, const std::string& to_id, LinkType type);
    bool unlink(const std::string& from_id, const std::string& to_id, LinkType type);
    std::vector<MemoryLink> links_from(const std::string& id);

    // Lifecycle flags. Archiving an archived memory (or restoring an
    // active one) changes nothing and logs nothing.
    Memory archive(const std::string& id, const std::string& reason);
    Memory restore(const std::string& id, const std::string& reason);
    Memory mark_consolidated(const std::string& id, const std::string& details);

    std::vector<ProvenanceEntry> history(const std::string& id) const;
    BeliefProvenance trace_provenance(const std::string& id,
                                      const TraceOptions& options = {}) const;

    SelfSchemaManager& self_schema() { return schema_; }

    // Snapshot of the system narrowed by the options, checksum included.
    MemorySystemSnapshot export_snapshot(const ShareOptions& options = {});
    std::string export_json(const ShareOptions& options = {});
    std::string export_html(const ShareOptions& options = {});

    // Verify the document's checksum, then insert what is missing.
    ImportReport import_json(const std::string& document);

    SessionSnapshot save_snapshot(SessionSnapshot draft);
    std::vector<SessionSnapshot> list_snapshots(uint32_t limit = 0);

    const Config& config() const { return config_; }
    Store& store() { return store_; }

private:
    Memory require_memory(const std::string& id);
    Memory set_flag(const std::string& id, bool Memory::*flag, bool value,
                    ProvenancePayload payload);

    Store& store_;
    Config config_;
    Clock clock_;
    ProvenanceLog log_;
    RetrievalEngine retrieval_;
    SelfSchemaManager schema_;
    ReconsolidationEngine reconsolidation_;
};

} // namespace engram

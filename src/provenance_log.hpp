#pragma once
#include "store.hpp"
#include "util.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engram {

struct TraceOptions {
    uint32_t max_depth = 5;
    bool include_access_history = false;
    bool include_reconsolidations = true;
};

// One step of the derivation walk: `memory_id` is a source of `parent_id`.
struct DerivationStep {
    std::string memory_id;
    std::string parent_id;
    std::string via;     // "source_memory_ids" or "derives_from"
    uint32_t depth = 1;
    bool resolved = true; // false when the source record is missing
};

// Why a belief exists: its origin, what it was derived from and how it changed.
struct BeliefProvenance {
    Memory memory;
    std::optional<ProvenanceEntry> creation;
    std::vector<DerivationStep> derivation_chain;
    std::vector<ProvenanceEntry> modifications;
    std::vector<ProvenanceEntry> accesses;
    std::vector<ReconsolidationEvent> reconsolidations;
    bool truncated = false; // depth limit or a cycle cut the walk
    std::string summary;
};

// Append-only audit trail over a Store. Appends are serialized, and
// timestamps never go backwards, so creation order equals append order.
class ProvenanceLog {
public:
    ProvenanceLog(Store& store, Clock clock, std::string agent_version = "");

    // Assigns the entry its id and created_at, then stores it. Storage
    // failures propagate; nothing else rejects an entry.
    std::string append(const std::string& memory_id, ProvenancePayload payload,
                       std::optional<std::string> session_id = std::nullopt);

    // Every entry for a memory, oldest first.
    std::vector<ProvenanceEntry> history(const std::string& memory_id) const;

    // Throws EngramError(NotFound) for an unknown memory.
    BeliefProvenance trace(const std::string& memory_id, const TraceOptions& options) const;

private:
    Store& store_;
    Clock clock_;
    std::string agent_version_;
    uint64_t last_created_at_ = 0;
    std::mutex mutex_;
};

// Human-readable one-paragraph account of a trace result.
std::string summarize_provenance(const BeliefProvenance& trace);

} // namespace engram

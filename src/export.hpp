#pragma once
#include "store.hpp"
#include "view.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

// Everything needed to reconstruct or audit a memory system, plus a
// SHA-256 checksum over the canonical serialization of the rest.
struct MemorySystemSnapshot {
    uint64_t exported_at = 0;
    std::string agent_id;
    int schema_version = CURRENT_SCHEMA_VERSION;
    std::vector<Memory> memories;
    std::optional<SelfSchema> self_schema;
    std::vector<ProvenanceEntry> provenance;
    std::vector<ReconsolidationEvent> reconsolidation_events;
    std::vector<MemoryLink> links;
    std::vector<SessionSnapshot> snapshots;
    std::string checksum;
};

struct ImportReport {
    uint32_t memories = 0;
    uint32_t provenance = 0;
    uint32_t reconsolidation_events = 0;
    uint32_t links = 0;
    uint32_t snapshots = 0;
    bool self_schema = false;
};

struct HtmlOptions {
    std::string title = "Memory export";
    std::string agent_name;
    std::string filter; // query the memories were narrowed by, shown in the header
    uint32_t page_size = DEFAULT_PAGE_SIZE;
    bool include_identity = true;
    bool include_snapshots = true;
};

// Gather all memories (archived included), the agent's self-schema, the
// full provenance log, reconsolidation events, links and session
// snapshots, then seal with a checksum.
MemorySystemSnapshot build_snapshot(Store& store, const std::string& agent_id, uint64_t now);

// Keep only the listed memories plus the provenance entries,
// reconsolidation events and links that concern them (a link needs both
// ends kept), then reseal the checksum.
void restrict_snapshot(MemorySystemSnapshot& snapshot, const std::vector<std::string>& memory_ids);

// Compact JSON of the snapshot without its checksum. Object keys are
// sorted, so equal contents give equal bytes.
std::string canonical_serialization(const MemorySystemSnapshot& snapshot);

// Lowercase hex SHA-256 of canonical_serialization().
std::string compute_checksum(const MemorySystemSnapshot& snapshot);

nlohmann::json snapshot_to_json(const MemorySystemSnapshot& snapshot);
MemorySystemSnapshot snapshot_from_json(const nlohmann::json& j);

// Parse a JSON export and verify its checksum. Throws
// EngramError(IntegrityMismatch) on a mismatch, SchemaViolation on a
// malformed document.
MemorySystemSnapshot parse_snapshot(const std::string& document);

// Insert records the store does not have yet. Existing ids are skipped.
ImportReport import_snapshot(Store& store, const MemorySystemSnapshot& snapshot);

// Self-contained offline document: statistics, the first page of the
// view, optional identity and session sections, and the whole snapshot
// inlined as a JSON payload for client-side filtering.
std::string render_html(const MemorySystemSnapshot& snapshot, const HtmlOptions& options);

// Atomic write. Throws EngramError(StorageFailure).
void write_export(const std::string& path, const std::string& content);

} // namespace engram

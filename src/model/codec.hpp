#pragma once
#include "memory.hpp"
#include "provenance.hpp"
#include "self_schema.hpp"
#include "session_snapshot.hpp"
#include <nlohmann/json.hpp>

namespace engram {

// JSON conversion for every persisted entity, shared by the stores,
// the export surface and the command layer. Keys are snake_case.
// Decoders throw EngramError(SchemaViolation) on missing required
// fields, unknown enum values or mistyped values.

// Memory layout is flat: the variant's fields sit beside the shared
// fields, selected by "type".
nlohmann::json memory_to_json(const Memory& memory);
Memory memory_from_json(const nlohmann::json& j);

nlohmann::json retrieval_context_to_json(const RetrievalContext& ctx);
RetrievalContext retrieval_context_from_json(const nlohmann::json& j);

nlohmann::json provenance_entry_to_json(const ProvenanceEntry& entry);
ProvenanceEntry provenance_entry_from_json(const nlohmann::json& j);

// The payload alone (the "data" object of an entry)
nlohmann::json provenance_payload_to_json(const ProvenancePayload& payload);

nlohmann::json reconsolidation_event_to_json(const ReconsolidationEvent& event);
ReconsolidationEvent reconsolidation_event_from_json(const nlohmann::json& j);

nlohmann::json link_to_json(const MemoryLink& link);
MemoryLink link_from_json(const nlohmann::json& j);

nlohmann::json self_schema_to_json(const SelfSchema& schema);
SelfSchema self_schema_from_json(const nlohmann::json& j);

nlohmann::json session_snapshot_to_json(const SessionSnapshot& snapshot);
SessionSnapshot session_snapshot_from_json(const nlohmann::json& j);

} // namespace engram

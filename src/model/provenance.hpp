#pragma once
#include "memory.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

enum class ProvenanceEventType {
    Created,
    Accessed,
    Modified,
    Reconsolidated,
    Linked,
    Unlinked,
    ImportanceChanged,
    Consolidated,
    Archived,
    Restored
};

enum class RetrievalTrigger { ExplicitRecall, Associative, CueMatch, Search, Random };
enum class CreationSource { UserInput, Inference, Consolidation, Import, Migration };
enum class LinkType { Supports, Contradicts, DerivesFrom, RelatedTo };
enum class FinalState { Updated, Unchanged, Strengthened, Weakened };

// Why a memory was retrieved.
struct RetrievalContext {
    RetrievalTrigger trigger = RetrievalTrigger::ExplicitRecall;
    std::optional<std::string> query;
    std::optional<std::string> conversation_id;
    std::optional<std::string> task_context;
    std::optional<std::string> emotional_state;
};

struct FieldChange {
    std::string field;
    nlohmann::json old_value;
    nlohmann::json new_value;
};

// ── Event payloads (one per ProvenanceEventType, same order) ─

struct CreatedEvent {
    static constexpr const char* Type = "created";
    CreationSource source = CreationSource::UserInput;
    std::string original_content;
    Importance initial_importance = Importance::Normal;
};

struct AccessedEvent {
    static constexpr const char* Type = "accessed";
    RetrievalContext context;
    bool triggered_reconsolidation = false;
};

struct ModifiedEvent {
    static constexpr const char* Type = "modified";
    std::vector<FieldChange> changes;
    std::string reason;
};

struct ReconsolidatedEvent {
    static constexpr const char* Type = "reconsolidated";
    std::string reconsolidation_event_id;
    std::string change_summary;
};

struct LinkedEvent {
    static constexpr const char* Type = "linked";
    std::string other_memory_id;
    LinkType link_type = LinkType::RelatedTo;
};

struct UnlinkedEvent {
    static constexpr const char* Type = "unlinked";
    std::string other_memory_id;
    LinkType link_type = LinkType::RelatedTo;
};

struct ImportanceChangedEvent {
    static constexpr const char* Type = "importance_changed";
    Importance previous = Importance::Normal;
    Importance current = Importance::Normal;
    std::string reason;
};

struct ConsolidatedEvent {
    static constexpr const char* Type = "consolidated";
    std::string details;
};

struct ArchivedEvent {
    static constexpr const char* Type = "archived";
    std::string details;
};

struct RestoredEvent {
    static constexpr const char* Type = "restored";
    std::string details;
};

using ProvenancePayload = std::variant<
    CreatedEvent,
    AccessedEvent,
    ModifiedEvent,
    ReconsolidatedEvent,
    LinkedEvent,
    UnlinkedEvent,
    ImportanceChangedEvent,
    ConsolidatedEvent,
    ArchivedEvent,
    RestoredEvent
>;

// One immutable audit record. Never updated or deleted once stored.
struct ProvenanceEntry {
    std::string id;
    std::string memory_id;
    ProvenancePayload payload;
    std::optional<std::string> session_id;
    std::optional<std::string> agent_version;
    uint64_t created_at = 0;

    ProvenanceEventType event_type() const {
        return static_cast<ProvenanceEventType>(payload.index());
    }
};

struct AppliedUpdate {
    std::string field;
    nlohmann::json previous_value;
    nlohmann::json new_value;
    std::string reason;
    uint64_t timestamp = 0;
};

// A lability window. Open while lability_window_end is empty.
struct ReconsolidationEvent {
    std::string id;
    std::string memory_id;
    uint64_t lability_window_start = 0;
    std::optional<uint64_t> lability_window_end;
    RetrievalContext trigger_context;
    std::vector<AppliedUpdate> updates_applied;
    std::optional<FinalState> final_state;

    bool is_open() const { return !lability_window_end.has_value(); }
};

struct MemoryLink {
    std::string from_id;
    std::string to_id;
    LinkType type = LinkType::RelatedTo;
    uint64_t created_at = 0;
};

std::string provenance_event_type_to_string(ProvenanceEventType type);
std::optional<ProvenanceEventType> provenance_event_type_from_string(const std::string& s);

std::string retrieval_trigger_to_string(RetrievalTrigger trigger);
std::optional<RetrievalTrigger> retrieval_trigger_from_string(const std::string& s);

std::string creation_source_to_string(CreationSource source);
std::optional<CreationSource> creation_source_from_string(const std::string& s);

std::string link_type_to_string(LinkType type);
std::optional<LinkType> link_type_from_string(const std::string& s);

std::string final_state_to_string(FinalState state);
std::optional<FinalState> final_state_from_string(const std::string& s);

} // namespace engram

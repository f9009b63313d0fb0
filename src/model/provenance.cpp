#include "provenance.hpp"
#include "enum_names.hpp"
#include <array>
#include <variant>

namespace engram {

static constexpr std::array<const char*, 10> EVENT_TYPE_NAMES = {
    CreatedEvent::Type, AccessedEvent::Type, ModifiedEvent::Type,
    ReconsolidatedEvent::Type, LinkedEvent::Type, UnlinkedEvent::Type,
    ImportanceChangedEvent::Type, ConsolidatedEvent::Type,
    ArchivedEvent::Type, RestoredEvent::Type};

static_assert(EVENT_TYPE_NAMES.size() == std::variant_size_v<ProvenancePayload>,
              "every event type needs a payload alternative");

static constexpr std::array<const char*, 5> TRIGGER_NAMES = {
    "explicit_recall", "associative", "cue_match", "search", "random"};
static constexpr std::array<const char*, 5> SOURCE_NAMES = {
    "user_input", "inference", "consolidation", "import", "migration"};
static constexpr std::array<const char*, 4> LINK_TYPE_NAMES = {
    "supports", "contradicts", "derives_from", "related_to"};
static constexpr std::array<const char*, 4> FINAL_STATE_NAMES = {
    "updated", "unchanged", "strengthened", "weakened"};

std::string provenance_event_type_to_string(ProvenanceEventType type) {
    return name_of(EVENT_TYPE_NAMES, type);
}
std::optional<ProvenanceEventType> provenance_event_type_from_string(const std::string& s) {
    return value_of<ProvenanceEventType>(EVENT_TYPE_NAMES, s);
}

std::string retrieval_trigger_to_string(RetrievalTrigger trigger) {
    return name_of(TRIGGER_NAMES, trigger);
}
std::optional<RetrievalTrigger> retrieval_trigger_from_string(const std::string& s) {
    return value_of<RetrievalTrigger>(TRIGGER_NAMES, s);
}

std::string creation_source_to_string(CreationSource source) {
    return name_of(SOURCE_NAMES, source);
}
std::optional<CreationSource> creation_source_from_string(const std::string& s) {
    return value_of<CreationSource>(SOURCE_NAMES, s);
}

std::string link_type_to_string(LinkType type) { return name_of(LINK_TYPE_NAMES, type); }
std::optional<LinkType> link_type_from_string(const std::string& s) {
    return value_of<LinkType>(LINK_TYPE_NAMES, s);
}

std::string final_state_to_string(FinalState state) { return name_of(FINAL_STATE_NAMES, state); }
std::optional<FinalState> final_state_from_string(const std::string& s) {
    return value_of<FinalState>(FINAL_STATE_NAMES, s);
}

} // namespace engram

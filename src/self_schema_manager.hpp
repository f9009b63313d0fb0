#pragma once
#include "store.hpp"
#include "util.hpp"
#include <functional>
#include <mutex>
#include <string>

namespace engram {

// Owns the single self-schema of one agent. Every change is validated
// as a whole, bumps version and updated_at, and is persisted before it
// becomes visible. Identity statements, capabilities and chapters must
// cite at least one existing memory (MissingEvidence otherwise).
class SelfSchemaManager {
public:
    SelfSchemaManager(Store& store, std::string agent_id, Clock clock);

    // Stored schema, or a fresh unsaved one if none exists yet.
    SelfSchema current();

    // Apply a structural change to a copy, validate, persist, return it.
    SelfSchema update(const std::function<void(SelfSchema&)>& mutator);

    // Convenience mutations. Drafts get their id and timestamps here.
    IdentityStatement add_identity_statement(IdentityStatement draft);
    IdentityStatement revise_identity_statement(const std::string& id, const IdentityStatement& revised);
    Capability add_capability(Capability draft);
    Capability revise_capability(const std::string& id, const Capability& revised);
    Relationship add_relationship(Relationship draft);
    Value add_value(Value draft);
    Limitation add_limitation(Limitation draft);
    Milestone add_milestone(Milestone draft);
    NarrativeChapter add_chapter(NarrativeChapter draft);
    SelfSchema revise_narrative(const std::string& core_summary, const std::string& changes,
                                const std::string& reason,
                                const std::vector<std::string>& trigger_memory_ids);
    SelfSchema set_current_state(AgentState state);
    SelfSchema set_present_phase(PhaseDescription phase);

    const std::string& agent_id() const { return agent_id_; }

private:
    SelfSchema load_or_create();

    Store& store_;
    std::string agent_id_;
    Clock clock_;
    std::mutex mutex_;
};

} // namespace engram

#include "reconsolidation.hpp"
#include "entity_id.hpp"
#include "errors.hpp"
#include "model/codec.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace engram {

static const std::unordered_set<std::string>& shared_fields() {
    static const std::unordered_set<std::string> fields = {
        "content", "context", "importance", "tags"};
    return fields;
}

static const std::unordered_set<std::string>& episodic_fields() {
    static const std::unordered_set<std::string> fields = {
        "event_type", "participants", "location", "emotional_valence", "emotional_tags"};
    return fields;
}

static const std::unordered_set<std::string>& semantic_fields() {
    static const std::unordered_set<std::string> fields = {
        "domain", "confidence", "source_memory_ids", "contradicts_ids",
        "valid_from", "valid_until"};
    return fields;
}

static const std::unordered_set<std::string>& procedural_fields() {
    static const std::unordered_set<std::string> fields = {
        "skill_name", "steps", "success_count", "failure_count",
        "last_success", "last_failure", "avg_duration_ms"};
    return fields;
}

// Optional fields; only these accept a null value.
static const std::unordered_set<std::string>& clearable_fields() {
    static const std::unordered_set<std::string> fields = {
        "context", "location", "emotional_valence", "valid_from", "valid_until",
        "last_success", "last_failure", "avg_duration_ms"};
    return fields;
}

bool is_mutable_field(MemoryType type, const std::string& field) {
    if (shared_fields().count(field)) return true;
    switch (type) {
        case MemoryType::Episodic:   return episodic_fields().count(field) > 0;
        case MemoryType::Semantic:   return semantic_fields().count(field) > 0;
        case MemoryType::Procedural: return procedural_fields().count(field) > 0;
    }
    return false;
}

static std::optional<int> rank_of(const nlohmann::json& v) {
    if (!v.is_string()) return std::nullopt;
    auto imp = importance_from_string(v.get<std::string>());
    if (!imp) return std::nullopt;
    return importance_rank(*imp);
}

FinalState compute_final_state(const ReconsolidationEvent& event) {
    std::optional<int> first_rank, last_rank;
    std::optional<double> first_conf, last_conf;
    for (const auto& u : event.updates_applied) {
        if (u.field == "importance") {
            if (!first_rank) first_rank = rank_of(u.previous_value);
            last_rank = rank_of(u.new_value);
        } else if (u.field == "confidence") {
            if (!first_conf && u.previous_value.is_number()) first_conf = u.previous_value.get<double>();
            if (u.new_value.is_number()) last_conf = u.new_value.get<double>();
        }
    }

    if (first_rank && last_rank && *first_rank != *last_rank) {
        return *last_rank > *first_rank ? FinalState::Strengthened : FinalState::Weakened;
    }
    if (first_conf && last_conf && *first_conf != *last_conf) {
        return *last_conf > *first_conf ? FinalState::Strengthened : FinalState::Weakened;
    }
    return event.updates_applied.empty() ? FinalState::Unchanged : FinalState::Updated;
}

static std::string change_summary(const ReconsolidationEvent& event, bool timed_out) {
    std::ostringstream out;
    out << event.updates_applied.size() << " update"
        << (event.updates_applied.size() == 1 ? "" : "s");
    if (!event.updates_applied.empty()) {
        out << " (";
        for (size_t i = 0; i < event.updates_applied.size(); ++i) {
            if (i > 0) out << ", ";
            out << event.updates_applied[i].field;
        }
        out << ")";
    }
    if (event.final_state) out << "; final state " << final_state_to_string(*event.final_state);
    out << (timed_out ? "; window timed out" : "; window closed");
    return out.str();
}

ReconsolidationEngine::ReconsolidationEngine(Store& store, ProvenanceLog& log,
                                             ReconsolidationConfig config, Clock clock)
    : store_(store), log_(log), config_(std::move(config)), clock_(std::move(clock)) {}

ReconsolidationEngine::~ReconsolidationEngine() {
    // Timer callbacks touch slots_; stop them before members go away.
    scheduler_.stop();
}

bool ReconsolidationEngine::qualifies(RetrievalTrigger trigger) const {
    auto name = retrieval_trigger_to_string(trigger);
    return std::find(config_.qualifying_triggers.begin(), config_.qualifying_triggers.end(),
                     name) != config_.qualifying_triggers.end();
}

std::shared_ptr<ReconsolidationEngine::WindowSlot> ReconsolidationEngine::slot_for(
    const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[memory_id];
    if (!slot) slot = std::make_shared<WindowSlot>();
    return slot;
}

void ReconsolidationEngine::release_slot(const std::string& memory_id,
                                         std::shared_ptr<WindowSlot>& slot) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(memory_id);
    // Held only by the map and this lease: no other thread can reach it.
    if (it != slots_.end() && it->second == slot && slot.use_count() == 2 &&
        !slot->open_event && slot->timer == 0) {
        slots_.erase(it);
    }
    slot.reset();
}

ReconsolidationEngine::SlotLease::SlotLease(ReconsolidationEngine& owner, const std::string& id)
    : engine(owner), memory_id(id), slot(owner.slot_for(id)) {}

ReconsolidationEngine::SlotLease::~SlotLease() {
    engine.release_slot(memory_id, slot);
}

size_t ReconsolidationEngine::resident_slots() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return slots_.size();
}

Memory ReconsolidationEngine::load_memory(const std::string& memory_id) {
    auto memory = store_.get_memory(memory_id);
    if (!memory) {
        throw EngramError(ErrorCode::NotFound, "memory '" + memory_id + "' does not exist");
    }
    return std::move(*memory);
}

void ReconsolidationEngine::ensure_loaded(WindowSlot& slot, const std::string& memory_id) {
    if (slot.loaded) return;

    for (auto& event : store_.reconsolidation_events_for(memory_id)) {
        if (event.is_open()) {
            if (!slot.open_event ||
                event.lability_window_start >= slot.open_event->lability_window_start) {
                slot.open_event = std::move(event);
            }
        } else if (!slot.last_closed_at || *event.lability_window_end > *slot.last_closed_at) {
            slot.last_closed_at = event.lability_window_end;
        }
    }
    slot.loaded = true;

    // A window left open by an earlier process: close it if it has run
    // out, otherwise re-arm its timer for the remaining time.
    if (slot.open_event) {
        uint64_t now = clock_();
        uint64_t deadline = slot.open_event->lability_window_start + config_.lability_window_ms;
        if (now >= deadline) {
            std::cerr << "[reconsolidation] Closing stale window " << slot.open_event->id
                      << " for " << memory_id << "\n";
            try {
                close_locked(slot, true);
            } catch (const EngramError& e) {
                std::cerr << "[reconsolidation] Stale window close failed, retrying: "
                          << e.what() << "\n";
                schedule_close(slot, memory_id, slot.open_event->id, config_.retry_delay_ms);
            }
        } else {
            schedule_close(slot, memory_id, slot.open_event->id, deadline - now);
        }
    }
}

void ReconsolidationEngine::schedule_close(WindowSlot& slot, const std::string& memory_id,
                                           const std::string& event_id, uint64_t delay_ms) {
    slot.timer = scheduler_.schedule_after(delay_ms, [this, memory_id, event_id] {
        on_timeout(memory_id, event_id);
    });
}

void ReconsolidationEngine::on_timeout(const std::string& memory_id, const std::string& event_id) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    // Closed early, or already replaced by a newer window.
    if (!slot->open_event || slot->open_event->id != event_id) return;
    slot->timer = 0;

    try {
        close_locked(*slot, true);
    } catch (const EngramError& e) {
        std::cerr << "[reconsolidation] Automatic close of " << event_id
                  << " failed, retrying in " << config_.retry_delay_ms << " ms: "
                  << e.what() << "\n";
        schedule_close(*slot, memory_id, event_id, config_.retry_delay_ms);
    }
}

AccessOutcome ReconsolidationEngine::access_locked(WindowSlot& slot, const std::string& memory_id,
                                                   const RetrievalContext& context,
                                                   bool force_open) {
    ensure_loaded(slot, memory_id);
    Memory memory = load_memory(memory_id);
    uint64_t now = clock_();

    bool open = false;
    if (force_open) {
        if (slot.open_event) {
            throw EngramError(ErrorCode::WindowAlreadyOpen,
                              "memory '" + memory_id + "' already has an open lability window (" +
                              slot.open_event->id + ")");
        }
        open = true;
    } else {
        bool interval_elapsed = !slot.last_closed_at ||
                                now >= *slot.last_closed_at + config_.min_interval_ms;
        open = qualifies(context.trigger) && !slot.open_event && interval_elapsed;
    }

    AccessedEvent accessed;
    accessed.context = context;
    accessed.triggered_reconsolidation = open;
    log_.append(memory_id, accessed, context.conversation_id);

    memory.access_count += 1;
    memory.last_accessed = now;
    store_.update_memory(memory);

    AccessOutcome outcome;
    outcome.memory = memory;
    if (open) {
        ReconsolidationEvent event;
        event.id = generate_id_at("recon", now);
        event.memory_id = memory_id;
        event.lability_window_start = now;
        event.trigger_context = context;
        store_.put_reconsolidation_event(event);

        slot.open_event = event;
        schedule_close(slot, memory_id, event.id, config_.lability_window_ms);
        outcome.window = std::move(event);
    }
    return outcome;
}

AccessOutcome ReconsolidationEngine::record_access(const std::string& memory_id,
                                                   const RetrievalContext& context) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return access_locked(*slot, memory_id, context, false);
}

ReconsolidationEvent ReconsolidationEngine::open_window(const std::string& memory_id,
                                                        const RetrievalContext& context) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    auto outcome = access_locked(*slot, memory_id, context, true);
    return std::move(*outcome.window);
}

Memory ReconsolidationEngine::apply_update(const std::string& memory_id, const FieldUpdate& update) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(*slot, memory_id);

    if (!slot->open_event) {
        throw EngramError(ErrorCode::NoActiveLabilityWindow,
                          "memory '" + memory_id + "' has no open lability window");
    }

    Memory memory = load_memory(memory_id);
    if (!is_mutable_field(memory.type(), update.field)) {
        throw EngramError(ErrorCode::ValidationError,
                          update.field + ": not a mutable field of a " +
                          memory_type_to_string(memory.type()) + " memory");
    }

    if (update.value.is_null() && !clearable_fields().count(update.field)) {
        throw EngramError(ErrorCode::ValidationError,
                          update.field + ": required field cannot be cleared");
    }

    nlohmann::json doc = memory_to_json(memory);
    nlohmann::json old_value = doc.contains(update.field) ? doc[update.field] : nlohmann::json();
    if (update.value.is_null()) {
        doc.erase(update.field);
    } else {
        doc[update.field] = update.value;
    }

    Memory updated = memory_from_json(doc);
    if (auto err = validate(updated)) err->raise();
    if (update.field == "source_memory_ids" || update.field == "contradicts_ids") {
        auto resolves = [this](const std::string& id) { return store_.get_memory(id).has_value(); };
        if (auto err = validate_references(updated, resolves)) err->raise();
    }

    bool weakens = importance_rank(updated.importance) < importance_rank(memory.importance);
    auto old_conf = memory.confidence();
    auto new_conf = updated.confidence();
    if (old_conf && new_conf && *new_conf < *old_conf) weakens = true;
    if (weakens && !config_.allow_weakening) {
        throw EngramError(ErrorCode::ValidationError,
                          update.field + ": weakening is disabled by configuration");
    }

    bool archive = new_conf && *new_conf < config_.deletion_threshold && !updated.is_archived;
    if (archive) updated.is_archived = true;

    uint64_t now = clock_();
    // What was stored, which may differ from what was submitted.
    nlohmann::json stored = memory_to_json(updated);
    nlohmann::json new_value = stored.contains(update.field) ? stored[update.field] : nlohmann::json();

    ModifiedEvent modified;
    modified.changes.push_back({update.field, old_value, new_value});
    modified.reason = update.reason;
    log_.append(memory_id, modified);

    if (updated.importance != memory.importance) {
        ImportanceChangedEvent changed;
        changed.previous = memory.importance;
        changed.current = updated.importance;
        changed.reason = update.reason;
        log_.append(memory_id, changed);
    }
    if (archive) {
        std::ostringstream details;
        details << "confidence " << *new_conf << " fell below deletion threshold "
                << config_.deletion_threshold;
        log_.append(memory_id, ArchivedEvent{details.str()});
    }

    store_.update_memory(updated);

    ReconsolidationEvent event = *slot->open_event;
    event.updates_applied.push_back({update.field, old_value, new_value, update.reason, now});
    store_.put_reconsolidation_event(event);
    slot->open_event = std::move(event);

    return updated;
}

ReconsolidationEvent ReconsolidationEngine::close_locked(WindowSlot& slot, bool timed_out) {
    ReconsolidationEvent event = *slot.open_event;
    event.lability_window_end = std::max(clock_(), event.lability_window_start);
    event.final_state = compute_final_state(event);

    ReconsolidatedEvent logged;
    logged.reconsolidation_event_id = event.id;
    logged.change_summary = change_summary(event, timed_out);

    // If either write fails the window stays open in memory.
    log_.append(event.memory_id, logged);
    store_.put_reconsolidation_event(event);

    if (slot.timer != 0) {
        scheduler_.cancel(slot.timer);
        slot.timer = 0;
    }
    slot.last_closed_at = event.lability_window_end;
    slot.open_event.reset();
    return event;
}

ReconsolidationEvent ReconsolidationEngine::close_window(const std::string& memory_id) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(*slot, memory_id);

    if (!slot->open_event) {
        throw EngramError(ErrorCode::NoActiveLabilityWindow,
                          "memory '" + memory_id + "' has no open lability window");
    }
    return close_locked(*slot, false);
}

std::optional<ReconsolidationEvent> ReconsolidationEngine::open_window_for(
    const std::string& memory_id) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    ensure_loaded(*slot, memory_id);
    return slot->open_event;
}

void ReconsolidationEngine::with_memory_lock(const std::string& memory_id,
                                             const std::function<void()>& fn) {
    SlotLease lease(*this, memory_id);
    const auto& slot = lease.slot;
    std::lock_guard<std::mutex> lock(slot->mutex);
    fn();
}

} // namespace engram

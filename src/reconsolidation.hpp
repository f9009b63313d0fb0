#pragma once
#include "config.hpp"
#include "provenance_log.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include "util.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace engram {

// A field-level change submitted while a window is open. A null value
// clears an optional field; required fields reject it.
struct FieldUpdate {
    std::string field;
    nlohmann::json value;
    std::string reason;
};

struct AccessOutcome {
    Memory memory;                              // after the access was counted
    std::optional<ReconsolidationEvent> window; // set when this access opened one
};

// Per-memory lability windows: Stable -> Labile on a qualifying access,
// Labile -> Stable on explicit close or timeout. At most one window is
// open per memory; each memory has its own lock, so unrelated memories
// never contend.
class ReconsolidationEngine {
public:
    ReconsolidationEngine(Store& store, ProvenanceLog& log,
                          ReconsolidationConfig config, Clock clock);
    ~ReconsolidationEngine();

    ReconsolidationEngine(const ReconsolidationEngine&) = delete;
    ReconsolidationEngine& operator=(const ReconsolidationEngine&) = delete;

    // Count an access. Opens a window if the trigger qualifies, none is
    // open and the minimum interval since the last close has passed.
    AccessOutcome record_access(const std::string& memory_id, const RetrievalContext& context);

    // Open a window regardless of trigger policy and interval. Counts as
    // an access. Throws WindowAlreadyOpen if one is open.
    ReconsolidationEvent open_window(const std::string& memory_id, const RetrievalContext& context);

    // Apply one change inside the open window. Throws NoActiveLabilityWindow,
    // ValidationError or SchemaViolation. Returns the updated memory.
    Memory apply_update(const std::string& memory_id, const FieldUpdate& update);

    // Close the open window now. Throws NoActiveLabilityWindow.
    ReconsolidationEvent close_window(const std::string& memory_id);

    std::optional<ReconsolidationEvent> open_window_for(const std::string& memory_id);

    bool qualifies(RetrievalTrigger trigger) const;

    // Run fn while holding the memory's lock, for structural changes
    // that must not interleave with a window operation.
    void with_memory_lock(const std::string& memory_id, const std::function<void()>& fn);

    const ReconsolidationConfig& config() const { return config_; }

    // Memories with window state held in memory. Slots with no open
    // window and no pending timer are dropped once released.
    size_t resident_slots() const;

private:
    struct WindowSlot {
        std::mutex mutex;
        bool loaded = false;
        std::optional<ReconsolidationEvent> open_event;
        std::optional<uint64_t> last_closed_at;
        DeferredScheduler::Ticket timer = 0;
    };

    // Holds a slot for one operation, then offers it for eviction.
    struct SlotLease {
        SlotLease(ReconsolidationEngine& owner, const std::string& id);
        ~SlotLease();
        SlotLease(const SlotLease&) = delete;
        SlotLease& operator=(const SlotLease&) = delete;

        ReconsolidationEngine& engine;
        std::string memory_id;
        std::shared_ptr<WindowSlot> slot;
    };

    std::shared_ptr<WindowSlot> slot_for(const std::string& memory_id);
    void release_slot(const std::string& memory_id, std::shared_ptr<WindowSlot>& slot);
    void ensure_loaded(WindowSlot& slot, const std::string& memory_id);
    Memory load_memory(const std::string& memory_id);

    AccessOutcome access_locked(WindowSlot& slot, const std::string& memory_id,
                                const RetrievalContext& context, bool force_open);
    ReconsolidationEvent close_locked(WindowSlot& slot, bool timed_out);
    void schedule_close(WindowSlot& slot, const std::string& memory_id,
                        const std::string& event_id, uint64_t delay_ms);
    void on_timeout(const std::string& memory_id, const std::string& event_id);

    Store& store_;
    ProvenanceLog& log_;
    ReconsolidationConfig config_;
    Clock clock_;

    mutable std::mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<WindowSlot>> slots_;

    DeferredScheduler scheduler_;
};

// Net direction of a window's updates: importance rank first, then
// confidence. Without a net change, any update gives Updated.
FinalState compute_final_state(const ReconsolidationEvent& event);

// Fields reconsolidation may change for a given memory type.
bool is_mutable_field(MemoryType type, const std::string& field);

} // namespace engram

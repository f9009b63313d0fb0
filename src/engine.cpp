#include "engine.hpp"
#include "entity_id.hpp"
#include "errors.hpp"
#include <iostream>

namespace engram {

MemoryEngine::MemoryEngine(Store& store, Config config, Clock clock)
    : store_(store)
    , config_(std::move(config))
    , clock_(std::move(clock))
    , log_(store_, clock_, config_.agent_version)
    , retrieval_(store_, config_.retrieval, clock_)
    , schema_(store_, config_.agent_id, clock_)
    , reconsolidation_(store_, log_, config_.reconsolidation, clock_)
{}

Memory MemoryEngine::require_memory(const std::string& id) {
    auto memory = store_.get_memory(id);
    if (!memory) throw EngramError(ErrorCode::NotFound, "memory '" + id + "' does not exist");
    return std::move(*memory);
}

Memory MemoryEngine::create(Memory draft, const CreateOptions& options) {
    uint64_t now = clock_();
    draft.id = generate_id_at("mem", now);
    draft.created_at = now;
    draft.access_count = 0;
    draft.last_accessed.reset();
    if (draft.schema_version < 1) draft.schema_version = CURRENT_SCHEMA_VERSION;
    if (auto* ep = std::get_if<EpisodicData>(&draft.detail)) {
        if (ep->event_timestamp == 0) ep->event_timestamp = now;
    }

    if (auto err = validate(draft)) err->raise();
    auto resolves = [this](const std::string& memory_id) {
        return store_.get_memory(memory_id).has_value();
    };
    if (auto err = validate_references(draft, resolves)) err->raise();

    store_.create_memory(draft);

    CreatedEvent created;
    created.source = options.source;
    created.original_content = draft.content;
    created.initial_importance = draft.importance;
    log_.append(draft.id, std::move(created), options.session_id);
    return draft;
}

std::optional<Memory> MemoryEngine::get(const std::string& id) {
    return store_.get_memory(id);
}

std::vector<Memory> MemoryEngine::query(const QueryCriteria& criteria) const {
    return retrieval_.query(criteria);
}

std::vector<ScoredMemory> MemoryEngine::rank(const QueryCriteria& criteria) const {
    return retrieval_.rank(criteria);
}

BudgetSelection MemoryEngine::query_within_budget(const QueryCriteria& criteria, uint64_t budget,
                                                  const CostFn& cost) const {
    return retrieval_.query_within_budget(criteria, budget, cost);
}

std::vector<AccessOutcome> MemoryEngine::recall(const QueryCriteria& criteria,
                                                const RetrievalContext& context) {
    std::vector<AccessOutcome> out;
    for (const auto& memory : retrieval_.query(criteria)) {
        out.push_back(reconsolidation_.record_access(memory.id, context));
    }
    return out;
}

AccessOutcome MemoryEngine::access(const std::string& id, const RetrievalContext& context) {
    return reconsolidation_.record_access(id, context);
}

ReconsolidationEvent MemoryEngine::open_window(const std::string& id,
                                               const RetrievalContext& context) {
    return reconsolidation_.open_window(id, context);
}

Memory MemoryEngine::apply_update(const std::string& id, const FieldUpdate& update) {
    return reconsolidation_.apply_update(id, update);
}

ReconsolidationEvent MemoryEngine::close_window(const std::string& id) {
    return reconsolidation_.close_window(id);
}

std::optional<ReconsolidationEvent> MemoryEngine::open_window_for(const std::string& id) {
    return reconsolidation_.open_window_for(id);
}

// ── Links ───────────────────────────────────────────────────────

bool MemoryEngine::link(const std::string& from_id, const std::string& to_id, LinkType type) {
    if (from_id == to_id) {
        throw EngramError(ErrorCode::ValidationError, "a memory cannot link to itself");
    }
    require_memory(from_id);
    require_memory(to_id);

    MemoryLink link;
    link.from_id = from_id;
    link.to_id = to_id;
    link.type = type;
    link.created_at = clock_();
    if (!store_.add_link(link)) return false;

    log_.append(from_id, LinkedEvent{to_id, type});
    log_.append(to_id, LinkedEvent{from_id, type});
    return true;
}

bool MemoryEngine::unlink(const std::string& from_id, const std::string& to_id, LinkType type) {
    require_memory(from_id);
    require_memory(to_id);
    if (!store_.remove_link(from_id, to_id, type)) return false;

    log_.append(from_id, UnlinkedEvent{to_id, type});
    log_.append(to_id, UnlinkedEvent{from_id, type});
    return true;
}

std::vector<MemoryLink> MemoryEngine::links_from(const std::string& id) {
    return store_.links_from(id);
}

// ── Lifecycle ───────────────────────────────────────────────────

Memory MemoryEngine::set_flag(const std::string& id, bool Memory::*flag, bool value,
                              ProvenancePayload payload) {
    Memory result;
    reconsolidation_.with_memory_lock(id, [&]() {
        result = require_memory(id);
        if (result.*flag == value) return;
        log_.append(id, std::move(payload));
        result.*flag = value;
        store_.update_memory(result);
    });
    return result;
}

Memory MemoryEngine::archive(const std::string& id, const std::string& reason) {
    return set_flag(id, &Memory::is_archived, true, ArchivedEvent{reason});
}

Memory MemoryEngine::restore(const std::string& id, const std::string& reason) {
    return set_flag(id, &Memory::is_archived, false, RestoredEvent{reason});
}

Memory MemoryEngine::mark_consolidated(const std::string& id, const std::string& details) {
    return set_flag(id, &Memory::is_consolidated, true, ConsolidatedEvent{details});
}

// ── Provenance ──────────────────────────────────────────────────

std::vector<ProvenanceEntry> MemoryEngine::history(const std::string& id) const {
    return log_.history(id);
}

BeliefProvenance MemoryEngine::trace_provenance(const std::string& id,
                                                const TraceOptions& options) const {
    return log_.trace(id, options);
}

// ── Export ──────────────────────────────────────────────────────

static constexpr uint32_t SHARE_QUERY_LIMIT = 1000;

MemorySystemSnapshot MemoryEngine::export_snapshot(const ShareOptions& options) {
    MemorySystemSnapshot snapshot = build_snapshot(store_, config_.agent_id, clock_());
    if (options.query && !trim(*options.query).empty()) {
        QueryCriteria criteria;
        criteria.text = *options.query;
        criteria.include_archived = true;
        criteria.limit = SHARE_QUERY_LIMIT;
        std::vector<std::string> ids;
        for (const auto& m : retrieval_.query(criteria)) ids.push_back(m.id);
        restrict_snapshot(snapshot, ids);
    }
    if (!options.with_identity || !options.with_snapshots) {
        if (!options.with_identity) snapshot.self_schema.reset();
        if (!options.with_snapshots) snapshot.snapshots.clear();
        snapshot.checksum = compute_checksum(snapshot);
    }
    return snapshot;
}

std::string MemoryEngine::export_json(const ShareOptions& options) {
    return snapshot_to_json(export_snapshot(options)).dump(2);
}

std::string MemoryEngine::export_html(const ShareOptions& options) {
    HtmlOptions html;
    html.agent_name = options.agent_name.value_or(config_.export_.agent_name);
    html.page_size = config_.export_.page_size;
    html.include_identity = options.with_identity;
    html.include_snapshots = options.with_snapshots;
    if (options.query) html.filter = trim(*options.query);
    return render_html(export_snapshot(options), html);
}

ImportReport MemoryEngine::import_json(const std::string& document) {
    MemorySystemSnapshot snapshot = parse_snapshot(document);
    ImportReport report = import_snapshot(store_, snapshot);
    std::cerr << "[import] " << report.memories << " memories, " << report.provenance
              << " provenance entries, " << report.links << " links\n";
    return report;
}

// ── Session snapshots ───────────────────────────────────────────

SessionSnapshot MemoryEngine::save_snapshot(SessionSnapshot draft) {
    if (trim(draft.name).empty()) {
        ValidationError{ErrorCode::ValidationError, "name", "snapshot name must not be empty"}.raise();
    }
    uint64_t now = clock_();
    draft.id = generate_id_at("snap", now);
    draft.created_at = now;
    store_.save_snapshot(draft);
    return draft;
}

std::vector<SessionSnapshot> MemoryEngine::list_snapshots(uint32_t limit) {
    return store_.list_snapshots(limit);
}

} // namespace engram

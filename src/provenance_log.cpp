#include "provenance_log.hpp"
#include "entity_id.hpp"
#include "errors.hpp"
#include <algorithm>
#include <functional>
#include <sstream>
#include <unordered_set>

namespace engram {

ProvenanceLog::ProvenanceLog(Store& store, Clock clock, std::string agent_version)
    : store_(store), clock_(std::move(clock)), agent_version_(std::move(agent_version)) {}

std::string ProvenanceLog::append(const std::string& memory_id, ProvenancePayload payload,
                                  std::optional<std::string> session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    ProvenanceEntry entry;
    entry.created_at = std::max(clock_(), last_created_at_);
    entry.id = generate_id_at("prov", entry.created_at);
    entry.memory_id = memory_id;
    entry.payload = std::move(payload);
    entry.session_id = std::move(session_id);
    if (!agent_version_.empty()) entry.agent_version = agent_version_;

    store_.append_provenance(entry);
    last_created_at_ = entry.created_at;
    return entry.id;
}

std::vector<ProvenanceEntry> ProvenanceLog::history(const std::string& memory_id) const {
    auto entries = store_.provenance_for(memory_id);
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ProvenanceEntry& a, const ProvenanceEntry& b) {
                         return a.created_at < b.created_at;
                     });
    return entries;
}

static bool is_modification(ProvenanceEventType type) {
    switch (type) {
        case ProvenanceEventType::Modified:
        case ProvenanceEventType::ImportanceChanged:
        case ProvenanceEventType::Archived:
        case ProvenanceEventType::Restored:
        case ProvenanceEventType::Consolidated:
        case ProvenanceEventType::Linked:
        case ProvenanceEventType::Unlinked:
            return true;
        default:
            return false;
    }
}

BeliefProvenance ProvenanceLog::trace(const std::string& memory_id,
                                      const TraceOptions& options) const {
    auto memory = store_.get_memory(memory_id);
    if (!memory) {
        throw EngramError(ErrorCode::NotFound, "memory '" + memory_id + "' does not exist");
    }

    BeliefProvenance result;
    result.memory = *memory;

    for (auto& entry : history(memory_id)) {
        auto type = entry.event_type();
        if (type == ProvenanceEventType::Created) {
            if (!result.creation) result.creation = std::move(entry);
        } else if (type == ProvenanceEventType::Accessed) {
            if (options.include_access_history) result.accesses.push_back(std::move(entry));
        } else if (is_modification(type)) {
            result.modifications.push_back(std::move(entry));
        }
    }

    if (options.include_reconsolidations) {
        result.reconsolidations = store_.reconsolidation_events_for(memory_id);
    }

    // Depth-first over declared sources. `visited` keeps each memory to a
    // single appearance; `on_path` detects cycles.
    std::unordered_set<std::string> visited{memory_id};
    std::unordered_set<std::string> on_path{memory_id};

    std::function<void(const Memory&, uint32_t)> walk = [&](const Memory& node, uint32_t depth) {
        std::vector<std::pair<std::string, std::string>> sources;
        if (auto* sem = std::get_if<SemanticData>(&node.detail)) {
            for (const auto& id : sem->source_memory_ids) sources.emplace_back(id, "source_memory_ids");
        }
        for (const auto& link : store_.links_from(node.id)) {
            if (link.type == LinkType::DerivesFrom) sources.emplace_back(link.to_id, "derives_from");
        }

        for (const auto& [source_id, via] : sources) {
            if (on_path.count(source_id)) {
                result.truncated = true;
                continue;
            }
            if (visited.count(source_id)) continue;
            if (depth + 1 > options.max_depth) {
                result.truncated = true;
                continue;
            }
            visited.insert(source_id);

            DerivationStep step;
            step.memory_id = source_id;
            step.parent_id = node.id;
            step.via = via;
            step.depth = depth + 1;

            auto source = store_.get_memory(source_id);
            step.resolved = source.has_value();
            result.derivation_chain.push_back(step);

            if (source) {
                on_path.insert(source_id);
                walk(*source, depth + 1);
                on_path.erase(source_id);
            }
        }
    };
    walk(*memory, 0);

    result.summary = summarize_provenance(result);
    return result;
}

std::string summarize_provenance(const BeliefProvenance& trace) {
    const auto& m = trace.memory;
    std::ostringstream out;
    out << "Memory " << m.id << " (" << memory_type_to_string(m.type()) << ", "
        << importance_to_string(m.importance) << " importance";
    if (auto conf = m.confidence()) out << ", confidence " << *conf;
    out << ")";

    if (trace.creation) {
        const auto& created = std::get<CreatedEvent>(trace.creation->payload);
        out << " was created at " << iso_timestamp(trace.creation->created_at)
            << " from " << creation_source_to_string(created.source) << ".";
    } else {
        out << " has no recorded creation entry.";
    }

    if (trace.derivation_chain.empty()) {
        out << " It is not derived from other memories.";
    } else {
        uint32_t deepest = 0;
        for (const auto& step : trace.derivation_chain) deepest = std::max(deepest, step.depth);
        out << " It derives from " << trace.derivation_chain.size() << " memor"
            << (trace.derivation_chain.size() == 1 ? "y" : "ies")
            << " across " << deepest << " level" << (deepest == 1 ? "" : "s") << ".";
    }
    if (trace.truncated) out << " The derivation walk was truncated.";

    out << " It has " << trace.modifications.size() << " recorded change"
        << (trace.modifications.size() == 1 ? "" : "s");
    out << " and " << trace.reconsolidations.size() << " reconsolidation window"
        << (trace.reconsolidations.size() == 1 ? "" : "s") << ".";
    out << " Accessed " << m.access_count << " time" << (m.access_count == 1 ? "" : "s") << ".";
    if (m.is_archived) out << " It is archived.";
    return out.str();
}

} // namespace engram

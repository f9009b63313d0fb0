#include "json_store.hpp"
#include "../errors.hpp"
#include "../model/codec.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

namespace engram {

JsonStore::JsonStore(const std::string& path) : path_(path) {}

void JsonStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_) return;
    if (!path_.empty()) load();
    open_ = true;
}

void JsonStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    if (!path_.empty()) clear();
}

bool JsonStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void JsonStore::require_open() const {
    if (!open_) {
        throw EngramError(ErrorCode::StorageFailure, "store is not open");
    }
}

void JsonStore::clear() {
    memories_.clear();
    memory_index_.clear();
    provenance_.clear();
    provenance_ids_.clear();
    events_.clear();
    links_.clear();
    schemas_.clear();
    snapshots_.clear();
}

void JsonStore::load() {
    clear();
    std::ifstream file(path_);
    if (!file.is_open()) return;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw EngramError(ErrorCode::StorageFailure,
                          "corrupt store file " + path_ + ": " + e.what());
    }
    if (!j.is_object()) {
        throw EngramError(ErrorCode::StorageFailure, "store file " + path_ + " is not an object");
    }

    try {
        for (const auto& item : j.value("memories", nlohmann::json::array())) {
            memory_index_[item.value("id", "")] = memories_.size();
            memories_.push_back(memory_from_json(item));
        }
        for (const auto& item : j.value("provenance", nlohmann::json::array())) {
            auto entry = provenance_entry_from_json(item);
            provenance_ids_[entry.id] = provenance_.size();
            provenance_.push_back(std::move(entry));
        }
        for (const auto& item : j.value("reconsolidation_events", nlohmann::json::array())) {
            events_.push_back(reconsolidation_event_from_json(item));
        }
        for (const auto& item : j.value("links", nlohmann::json::array())) {
            links_.push_back(link_from_json(item));
        }
        for (const auto& item : j.value("self_schemas", nlohmann::json::array())) {
            auto schema = self_schema_from_json(item);
            schemas_[schema.agent_id] = std::move(schema);
        }
        for (const auto& item : j.value("snapshots", nlohmann::json::array())) {
            snapshots_.push_back(session_snapshot_from_json(item));
        }
    } catch (const EngramError& e) {
        throw EngramError(ErrorCode::StorageFailure,
                          "corrupt record in " + path_ + ": " + e.detail());
    }
}

void JsonStore::save() {
    if (path_.empty()) return;

    nlohmann::json j = {
        {"memories", nlohmann::json::array()},
        {"provenance", nlohmann::json::array()},
        {"reconsolidation_events", nlohmann::json::array()},
        {"links", nlohmann::json::array()},
        {"self_schemas", nlohmann::json::array()},
        {"snapshots", nlohmann::json::array()}
    };
    for (const auto& m : memories_) j["memories"].push_back(memory_to_json(m));
    for (const auto& p : provenance_) j["provenance"].push_back(provenance_entry_to_json(p));
    for (const auto& e : events_) j["reconsolidation_events"].push_back(reconsolidation_event_to_json(e));
    for (const auto& l : links_) j["links"].push_back(link_to_json(l));
    for (const auto& [agent, schema] : schemas_) j["self_schemas"].push_back(self_schema_to_json(schema));
    for (const auto& s : snapshots_) j["snapshots"].push_back(session_snapshot_to_json(s));

    if (!atomic_write_file(path_, j.dump(2))) {
        throw EngramError(ErrorCode::StorageFailure, "failed to write " + path_);
    }
}

// ── Memories ─────────────────────────────────────────────────

void JsonStore::create_memory(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    if (memory_index_.count(memory.id)) {
        throw EngramError(ErrorCode::StorageFailure,
                          "memory '" + memory.id + "' already exists");
    }
    memory_index_[memory.id] = memories_.size();
    memories_.push_back(memory);
    try {
        save();
    } catch (const std::exception&) {
        memories_.pop_back();
        memory_index_.erase(memory.id);
        throw;
    }
}

std::optional<Memory> JsonStore::get_memory(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = memory_index_.find(id);
    if (it != memory_index_.end()) return memories_[it->second];
    return std::nullopt;
}

void JsonStore::update_memory(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = memory_index_.find(memory.id);
    if (it == memory_index_.end()) {
        throw EngramError(ErrorCode::NotFound, "memory '" + memory.id + "' does not exist");
    }
    Memory previous = memories_[it->second];
    memories_[it->second] = memory;
    try {
        save();
    } catch (const std::exception&) {
        memories_[it->second] = std::move(previous);
        throw;
    }
}

std::vector<Memory> JsonStore::query_memories(const MemoryFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<Memory> results;
    for (const auto& m : memories_) {
        if (matches_filter(m, filter)) results.push_back(m);
    }
    std::sort(results.begin(), results.end(), [](const Memory& a, const Memory& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
    return results;
}

uint32_t JsonStore::count_memories() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return static_cast<uint32_t>(memories_.size());
}

// ── Provenance ───────────────────────────────────────────────

void JsonStore::append_provenance(const ProvenanceEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    if (provenance_ids_.count(entry.id)) {
        throw EngramError(ErrorCode::StorageFailure,
                          "provenance entry '" + entry.id + "' already exists");
    }
    provenance_ids_[entry.id] = provenance_.size();
    provenance_.push_back(entry);
    try {
        save();
    } catch (const std::exception&) {
        // A failed append leaves no trace.
        provenance_.pop_back();
        provenance_ids_.erase(entry.id);
        throw;
    }
}

std::vector<ProvenanceEntry> JsonStore::provenance_for(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<ProvenanceEntry> results;
    for (const auto& p : provenance_) {
        if (p.memory_id == memory_id) results.push_back(p);
    }
    return results;
}

std::vector<ProvenanceEntry> JsonStore::all_provenance() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return provenance_;
}

// ── Reconsolidation events ───────────────────────────────────

void JsonStore::put_reconsolidation_event(const ReconsolidationEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = std::find_if(events_.begin(), events_.end(),
                           [&event](const ReconsolidationEvent& e) { return e.id == event.id; });
    if (it != events_.end()) {
        ReconsolidationEvent previous = *it;
        *it = event;
        try {
            save();
        } catch (const std::exception&) {
            *it = std::move(previous);
            throw;
        }
        return;
    }
    events_.push_back(event);
    try {
        save();
    } catch (const std::exception&) {
        events_.pop_back();
        throw;
    }
}

std::vector<ReconsolidationEvent> JsonStore::reconsolidation_events_for(
    const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<ReconsolidationEvent> results;
    for (const auto& e : events_) {
        if (e.memory_id == memory_id) results.push_back(e);
    }
    return results;
}

std::vector<ReconsolidationEvent> JsonStore::all_reconsolidation_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return events_;
}

// ── Links ────────────────────────────────────────────────────

bool JsonStore::add_link(const MemoryLink& link) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    for (const auto& l : links_) {
        if (l.from_id == link.from_id && l.to_id == link.to_id && l.type == link.type) {
            return false;
        }
    }
    links_.push_back(link);
    save();
    return true;
}

bool JsonStore::remove_link(const std::string& from_id, const std::string& to_id,
                            LinkType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = std::find_if(links_.begin(), links_.end(), [&](const MemoryLink& l) {
        return l.from_id == from_id && l.to_id == to_id && l.type == type;
    });
    if (it == links_.end()) return false;
    links_.erase(it);
    save();
    return true;
}

std::vector<MemoryLink> JsonStore::links_from(const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<MemoryLink> results;
    for (const auto& l : links_) {
        if (l.from_id == memory_id) results.push_back(l);
    }
    return results;
}

std::vector<MemoryLink> JsonStore::all_links() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    return links_;
}

// ── Self-schema ──────────────────────────────────────────────

std::optional<SelfSchema> JsonStore::get_self_schema(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = schemas_.find(agent_id);
    if (it != schemas_.end()) return it->second;
    return std::nullopt;
}

void JsonStore::put_self_schema(const SelfSchema& schema) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    schemas_[schema.agent_id] = schema;
    save();
}

// ── Session snapshots ────────────────────────────────────────

void JsonStore::save_snapshot(const SessionSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    auto it = std::find_if(snapshots_.begin(), snapshots_.end(),
                           [&snapshot](const SessionSnapshot& s) { return s.id == snapshot.id; });
    if (it != snapshots_.end()) {
        *it = snapshot;
    } else {
        snapshots_.push_back(snapshot);
    }
    save();
}

std::vector<SessionSnapshot> JsonStore::list_snapshots(uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::vector<SessionSnapshot> results = snapshots_;
    std::sort(results.begin(), results.end(), [](const SessionSnapshot& a, const SessionSnapshot& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    if (limit > 0 && results.size() > limit) results.resize(limit);
    return results;
}

} // namespace engram

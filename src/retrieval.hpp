#pragma once
#include "config.hpp"
#include "store.hpp"
#include "util.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace engram {

enum class SortKey { Relevance, Recency, Importance, AccessCount };

std::string sort_key_to_string(SortKey key);
std::optional<SortKey> sort_key_from_string(const std::string& s);

struct QueryCriteria {
    std::optional<std::string> text;
    std::vector<MemoryType> types;          // empty = any
    std::vector<Importance> importances;    // empty = any
    std::vector<std::string> tags;          // any-match, empty = any
    std::optional<uint64_t> created_after;  // inclusive
    std::optional<uint64_t> created_before; // inclusive
    std::optional<double> min_confidence;   // only constrains semantic memories
    bool include_archived = false;
    uint32_t limit = 50;
    int64_t offset = 0;
    SortKey sort = SortKey::Relevance;
};

struct ScoredMemory {
    Memory memory;
    double score = 0.0;
    double text_match = 0.0;
};

struct BudgetSelection {
    std::vector<Memory> selected;
    uint64_t total_cost = 0;
};

using CostFn = std::function<uint64_t(const Memory&)>;

// Estimated tokens of the memory's serialized form.
uint64_t default_cost(const Memory& memory);

// Case-insensitive match of a query against content, context and tags,
// in [0, 1]. Content hits outrank context hits, which outrank tag hits.
double text_match(const std::string& query, const Memory& memory);

// exp(-ln2 * age / half_life); 1.0 when half_life is 0.
double recency_decay(uint64_t age_ms, uint64_t half_life_ms);

// critical 1.0, high 0.75, normal 0.5, low 0.25
double importance_weight(Importance importance);

// Throws EngramError(InvalidQuery) on malformed criteria.
void validate_criteria(const QueryCriteria& criteria);

// Hybrid ranking over store candidates. Read-only: a query never counts
// as an access.
class RetrievalEngine {
public:
    RetrievalEngine(Store& store, RetrievalConfig config, Clock clock);

    // Ranked, filtered and paginated results with their scores.
    std::vector<ScoredMemory> rank(const QueryCriteria& criteria) const;

    std::vector<Memory> query(const QueryCriteria& criteria) const;

    // Greedy highest-score-first packing; criteria.sort is ignored. Stops
    // at the first candidate that would overflow the budget; never
    // includes a memory partially.
    BudgetSelection query_within_budget(const QueryCriteria& criteria, uint64_t budget,
                                        const CostFn& cost = default_cost) const;

    double score(const Memory& memory, const std::string& text, uint64_t now) const;

    const RetrievalConfig& config() const { return config_; }

private:
    Store& store_;
    RetrievalConfig config_;
    Clock clock_;
};

} // namespace engram

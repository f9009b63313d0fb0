#include "retrieval.hpp"
#include "errors.hpp"
#include "model/codec.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace engram {

std::string sort_key_to_string(SortKey key) {
    switch (key) {
        case SortKey::Relevance:   return "relevance";
        case SortKey::Recency:     return "recency";
        case SortKey::Importance:  return "importance";
        case SortKey::AccessCount: return "access_count";
    }
    return "relevance";
}

std::optional<SortKey> sort_key_from_string(const std::string& s) {
    if (s == "relevance")    return SortKey::Relevance;
    if (s == "recency")      return SortKey::Recency;
    if (s == "importance")   return SortKey::Importance;
    if (s == "access_count") return SortKey::AccessCount;
    return std::nullopt;
}

uint64_t default_cost(const Memory& memory) {
    return estimate_tokens(memory_to_json(memory).dump());
}

static std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::string lower = to_lower(s);
    std::string token;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else if (!token.empty()) {
            tokens.push_back(std::move(token));
            token.clear();
        }
    }
    if (!token.empty()) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

static bool has_token(const std::vector<std::string>& tokens, const std::string& t) {
    return std::find(tokens.begin(), tokens.end(), t) != tokens.end();
}

double text_match(const std::string& query, const Memory& memory) {
    std::string q = to_lower(trim(query));
    if (q.empty()) return 0.0;

    std::string content = to_lower(memory.content);
    std::string context = memory.context ? to_lower(*memory.context) : std::string();

    // Whole-phrase hits
    double phrase = 0.0;
    if (content.find(q) != std::string::npos) {
        phrase = 1.0;
    } else if (!context.empty() && context.find(q) != std::string::npos) {
        phrase = 0.8;
    } else {
        for (const auto& tag : memory.tags) {
            std::string t = to_lower(tag);
            if (t == q) phrase = std::max(phrase, 0.7);
            else if (t.find(q) != std::string::npos) phrase = std::max(phrase, 0.5);
        }
    }

    // Word-level hits, so multi-word queries match scattered words.
    auto query_tokens = tokenize(q);
    if (query_tokens.empty()) return phrase;

    auto content_tokens = tokenize(content);
    auto context_tokens = tokenize(context);
    std::vector<std::string> tag_tokens;
    for (const auto& tag : memory.tags) {
        for (auto& t : tokenize(tag)) tag_tokens.push_back(std::move(t));
    }

    double words = 0.0;
    for (const auto& token : query_tokens) {
        if (has_token(content_tokens, token)) {
            words += 0.6;
        } else if (has_token(context_tokens, token)) {
            words += 0.5;
        } else if (has_token(tag_tokens, token)) {
            words += 0.4;
        }
    }
    words /= static_cast<double>(query_tokens.size());

    return std::max(phrase, words);
}

double recency_decay(uint64_t age_ms, uint64_t half_life_ms) {
    if (half_life_ms == 0) return 1.0;
    double ratio = static_cast<double>(age_ms) / static_cast<double>(half_life_ms);
    return std::exp(-std::log(2.0) * ratio);
}

double importance_weight(Importance importance) {
    switch (importance) {
        case Importance::Critical: return 1.0;
        case Importance::High:     return 0.75;
        case Importance::Normal:   return 0.5;
        case Importance::Low:      return 0.25;
    }
    return 0.5;
}

void validate_criteria(const QueryCriteria& criteria) {
    if (criteria.offset < 0) {
        throw EngramError(ErrorCode::InvalidQuery, "offset must not be negative");
    }
    if (criteria.limit == 0) {
        throw EngramError(ErrorCode::InvalidQuery, "limit must be positive");
    }
    if (criteria.min_confidence &&
        !(*criteria.min_confidence >= 0.0 && *criteria.min_confidence <= 1.0)) {
        throw EngramError(ErrorCode::InvalidQuery, "min_confidence must be within [0, 1]");
    }
    if (criteria.created_after && criteria.created_before &&
        *criteria.created_after > *criteria.created_before) {
        throw EngramError(ErrorCode::InvalidQuery, "created_after is later than created_before");
    }
}

RetrievalEngine::RetrievalEngine(Store& store, RetrievalConfig config, Clock clock)
    : store_(store), config_(std::move(config)), clock_(std::move(clock)) {}

double RetrievalEngine::score(const Memory& memory, const std::string& text, uint64_t now) const {
    uint64_t age = now > memory.created_at ? now - memory.created_at : 0;
    return config_.text_weight * text_match(text, memory) +
           config_.recency_weight * recency_decay(age, config_.recency_half_life_ms) +
           config_.importance_weight * importance_weight(memory.importance) +
           config_.frequency_weight * std::log1p(static_cast<double>(memory.access_count));
}

static bool newer_first(const ScoredMemory& a, const ScoredMemory& b) {
    if (a.memory.created_at != b.memory.created_at) return a.memory.created_at > b.memory.created_at;
    return a.memory.id < b.memory.id;
}

std::vector<ScoredMemory> RetrievalEngine::rank(const QueryCriteria& criteria) const {
    validate_criteria(criteria);

    MemoryFilter filter;
    filter.types = criteria.types;
    filter.importances = criteria.importances;
    filter.created_after = criteria.created_after;
    filter.created_before = criteria.created_before;
    filter.include_archived = criteria.include_archived;

    std::string text = criteria.text ? trim(*criteria.text) : std::string();
    uint64_t now = clock_();

    std::vector<ScoredMemory> scored;
    for (auto& memory : store_.query_memories(filter)) {
        if (!criteria.tags.empty()) {
            bool any = std::any_of(criteria.tags.begin(), criteria.tags.end(),
                [&memory](const std::string& tag) {
                    return std::find(memory.tags.begin(), memory.tags.end(), tag) != memory.tags.end();
                });
            if (!any) continue;
        }
        if (criteria.min_confidence) {
            auto conf = memory.confidence();
            if (conf && *conf < *criteria.min_confidence) continue;
        }

        ScoredMemory sm;
        sm.text_match = text.empty() ? 0.0 : text_match(text, memory);
        if (!text.empty() && sm.text_match <= 0.0) continue;
        sm.score = score(memory, text, now);
        sm.memory = std::move(memory);
        scored.push_back(std::move(sm));
    }

    auto by_key = [&criteria](const ScoredMemory& a, const ScoredMemory& b) {
        switch (criteria.sort) {
            case SortKey::Relevance:
                if (a.score != b.score) return a.score > b.score;
                break;
            case SortKey::Recency:
                break;
            case SortKey::Importance: {
                int ra = importance_rank(a.memory.importance);
                int rb = importance_rank(b.memory.importance);
                if (ra != rb) return ra > rb;
                break;
            }
            case SortKey::AccessCount:
                if (a.memory.access_count != b.memory.access_count)
                    return a.memory.access_count > b.memory.access_count;
                break;
        }
        return newer_first(a, b);
    };
    std::sort(scored.begin(), scored.end(), by_key);

    auto offset = static_cast<size_t>(criteria.offset);
    if (offset >= scored.size()) return {};
    size_t end = std::min(scored.size(), offset + static_cast<size_t>(criteria.limit));
    return std::vector<ScoredMemory>(std::make_move_iterator(scored.begin() + static_cast<ptrdiff_t>(offset)),
                                     std::make_move_iterator(scored.begin() + static_cast<ptrdiff_t>(end)));
}

std::vector<Memory> RetrievalEngine::query(const QueryCriteria& criteria) const {
    std::vector<Memory> results;
    for (auto& sm : rank(criteria)) {
        results.push_back(std::move(sm.memory));
    }
    return results;
}

BudgetSelection RetrievalEngine::query_within_budget(const QueryCriteria& criteria,
                                                     uint64_t budget,
                                                     const CostFn& cost) const {
    const CostFn& cost_of = cost ? cost : CostFn(default_cost);
    // Packing always runs in descending score order.
    QueryCriteria by_score = criteria;
    by_score.sort = SortKey::Relevance;
    BudgetSelection selection;
    for (auto& sm : rank(by_score)) {
        uint64_t c = cost_of(sm.memory);
        if (selection.total_cost + c > budget) break;
        selection.total_cost += c;
        selection.selected.push_back(std::move(sm.memory));
    }
    return selection;
}

} // namespace engram

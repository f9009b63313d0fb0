#include "view.hpp"
#include "util.hpp"
#include <algorithm>

namespace engram {

ViewProjection::ViewProjection(std::vector<Memory> memories, uint32_t page_size)
    : memories_(std::move(memories)), page_size_(page_size == 0 ? DEFAULT_PAGE_SIZE : page_size) {
    std::sort(memories_.begin(), memories_.end(), [](const Memory& a, const Memory& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id < b.id;
    });
}

ViewState ViewProjection::initial_state() const {
    ViewState state;
    state.visible_count = page_size_;
    return state;
}

bool view_matches(const Memory& memory, const ViewState& state) {
    if (state.type && memory.type() != *state.type) return false;
    if (state.importance && memory.importance != *state.importance) return false;

    std::string needle = to_lower(trim(state.search));
    if (needle.empty()) return true;

    std::string haystack = memory.content;
    if (memory.context) haystack += " " + *memory.context;
    for (const auto& tag : memory.tags) haystack += " " + tag;
    return to_lower(haystack).find(needle) != std::string::npos;
}

std::vector<Memory> ViewProjection::matching(const ViewState& state) const {
    std::vector<Memory> out;
    for (const auto& m : memories_) {
        if (view_matches(m, state)) out.push_back(m);
    }
    return out;
}

ViewPage ViewProjection::apply(const ViewState& state) const {
    ViewPage page;
    for (const auto& m : memories_) {
        if (!view_matches(m, state)) continue;
        ++page.total_matching;
        if (page.visible.size() < state.visible_count) page.visible.push_back(m);
    }
    page.has_more = page.total_matching > page.visible.size();
    return page;
}

ViewState ViewProjection::show_more(const ViewState& state) const {
    ViewState next = state;
    next.visible_count = state.visible_count + page_size_;
    return next;
}

} // namespace engram

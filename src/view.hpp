#pragma once
#include "model/memory.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

constexpr uint32_t DEFAULT_PAGE_SIZE = 50;

// Filter and paging state of an export view.
struct ViewState {
    std::optional<MemoryType> type;
    std::optional<Importance> importance;
    std::string search;                        // case-insensitive substring
    uint32_t visible_count = DEFAULT_PAGE_SIZE;
};

struct ViewPage {
    std::vector<Memory> visible;
    size_t total_matching = 0;
    bool has_more = false;
};

// Read-only projection over an already materialized result set. Holds
// its own sorted copy (newest first, ties by id) and never touches a
// store, so the same state always yields the same page.
class ViewProjection {
public:
    explicit ViewProjection(std::vector<Memory> memories,
                            uint32_t page_size = DEFAULT_PAGE_SIZE);

    ViewState initial_state() const;

    // Every memory matching the state's filters, in view order.
    std::vector<Memory> matching(const ViewState& state) const;

    // The first visible_count matches.
    ViewPage apply(const ViewState& state) const;

    // Same filters, one more page visible.
    ViewState show_more(const ViewState& state) const;

    size_t size() const { return memories_.size(); }
    uint32_t page_size() const { return page_size_; }

private:
    std::vector<Memory> memories_;
    uint32_t page_size_;
};

// True if the memory passes the state's type, importance and search filters.
bool view_matches(const Memory& memory, const ViewState& state);

} // namespace engram

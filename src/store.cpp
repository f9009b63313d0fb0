#include "store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "store/json_store.hpp"
#include "store/sqlite_store.hpp"
#include <algorithm>

namespace engram {

std::unique_ptr<Store> create_store(const Config& config) {
    const auto& backend = config.storage.backend;
    if (backend == "sqlite") {
        return std::make_unique<SqliteStore>(config.storage_path());
    }
    if (backend == "json") {
        return std::make_unique<JsonStore>(config.storage_path());
    }
    throw EngramError(ErrorCode::ValidationError,
                      "storage.backend: unknown storage backend '" + backend + "'");
}

bool matches_filter(const Memory& memory, const MemoryFilter& filter) {
    if (memory.is_archived && !filter.include_archived) return false;
    if (!filter.types.empty() &&
        std::find(filter.types.begin(), filter.types.end(), memory.type()) == filter.types.end())
        return false;
    if (!filter.importances.empty() &&
        std::find(filter.importances.begin(), filter.importances.end(), memory.importance) ==
            filter.importances.end())
        return false;
    if (filter.created_after && memory.created_at < *filter.created_after) return false;
    if (filter.created_before && memory.created_at > *filter.created_before) return false;
    return true;
}

} // namespace engram

#include "session_snapshot.hpp"
#include "enum_names.hpp"

namespace engram {

static constexpr std::array<const char*, 4> SNAPSHOT_IMPORTANCE_NAMES = {
    "critical", "important", "normal", "reference"};

std::string snapshot_importance_to_string(SnapshotImportance importance) {
    return name_of(SNAPSHOT_IMPORTANCE_NAMES, importance);
}

std::optional<SnapshotImportance> snapshot_importance_from_string(const std::string& s) {
    return value_of<SnapshotImportance>(SNAPSHOT_IMPORTANCE_NAMES, s);
}

} // namespace engram

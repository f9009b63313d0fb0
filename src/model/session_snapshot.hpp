#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

enum class SnapshotImportance { Critical, Important, Normal, Reference };

// Saved working-session state, listed alongside memories in exports.
struct SessionSnapshot {
    std::string id;
    std::string name;
    std::string summary;
    std::optional<std::string> project_path;
    std::optional<std::string> context;
    std::vector<std::string> decisions;
    std::vector<std::string> next_steps;
    std::vector<std::string> files_touched;
    std::vector<std::string> tags;
    SnapshotImportance importance = SnapshotImportance::Normal;
    uint64_t created_at = 0;
};

std::string snapshot_importance_to_string(SnapshotImportance importance);
std::optional<SnapshotImportance> snapshot_importance_from_string(const std::string& s);

} // namespace engram

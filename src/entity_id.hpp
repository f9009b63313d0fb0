#pragma once
#include <cstdint>
#include <string>

namespace engram {

// Sortable identifiers: 10 Crockford base-32 characters of epoch millis
// followed by 16 random characters, optionally "prefix_" tagged.
//
//   mem_01JB3Z6Q4W8N2K5T7V9XCDEFGH

constexpr size_t ID_TIME_CHARS = 10;
constexpr size_t ID_RANDOM_CHARS = 16;

// New id stamped with the current time. Empty prefix means no tag.
std::string generate_id(const std::string& prefix = "");

// New id stamped with the given epoch millis.
std::string generate_id_at(const std::string& prefix, uint64_t millis);

// Decode the creation time. Throws EngramError(InvalidIdentifier).
uint64_t timestamp_of(const std::string& id);

} // namespace engram

#pragma once
#include <string>
#include <cstdint>
#include <functional>

namespace engram {

// Millisecond clock. Components take one so tests can drive time by hand.
using Clock = std::function<uint64_t()>;

// Unix epoch milliseconds
uint64_t epoch_millis();

// Clock backed by epoch_millis()
Clock system_clock();

// ISO 8601 timestamp (UTC, millisecond precision) for an epoch-millis value
std::string iso_timestamp(uint64_t millis);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Estimate token count from text (~4 chars per token)
uint32_t estimate_tokens(const std::string& text);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Escape &, <, >, " and ' for HTML text and attribute contexts
std::string html_escape(const std::string& s);

} // namespace engram

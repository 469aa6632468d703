#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace chanflow {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// Local calendar date as YYYY-MM-DD
std::string local_date_today();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to a sibling temp file, then rename over path.
// Creates missing parent directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace chanflow

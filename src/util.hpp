#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace purgecord {

// ISO 8601 timestamp (UTC)
std::string timestamp_now();

// ISO 8601 timestamp for the given epoch seconds (UTC)
std::string format_timestamp(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(std::string s);

// Percent-encode a query string component (RFC 3986 unreserved set kept)
std::string url_encode(const std::string& s);

// "1h 2m 3s"
std::string format_duration(uint64_t seconds);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to <path>.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& contents);

} // namespace purgecord

#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstdint>

namespace callgate {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to path + ".tmp" then rename over path. Creates parent directories.
// Returns false if any step fails; the original file is left untouched.
bool atomic_write_file(const std::string& path, const std::string& content);

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// key=value&key=value with both sides percent-encoded
std::string form_encode(const std::vector<std::pair<std::string, std::string>>& params);

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace callgate

#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace rconbridge {

// ISO 8601 timestamp (UTC, seconds precision)
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Parse an RFC 3339 timestamp ("2024-03-21T20:39:14.123456789Z").
// Fractional seconds are accepted and dropped. Returns false on malformed input.
bool parse_rfc3339(const std::string& s, uint64_t& epoch_out);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

bool starts_with(const std::string& s, const std::string& prefix);

// Lowercase hex of a byte buffer
std::string hex_encode(const unsigned char* data, size_t len);

// Parse "host:port". False if malformed or the port is out of 1..65535
// (port 0 only with allow_zero_port, for "any free port" binds).
bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port,
                     bool allow_zero_port = false);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a sibling temp file, then rename over path. Creates parent
// directories. Returns false on any I/O failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace rconbridge

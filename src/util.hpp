#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace minim {

// Format epoch seconds as %Y-%m-%dT%H:%M:%SZ
std::string format_timestamp(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch microseconds
uint64_t epoch_micros();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Join with separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

std::string to_lower(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via a uniquely named sibling .tmp file and rename over the target.
// Creates the parent directory when missing.
bool atomic_write_file(const std::string& path, const std::string& content);

// Standard base64 (with padding)
std::string base64_encode(const std::string& data);
std::string base64_decode(const std::string& data);

// URL-safe base64 without padding
std::string base64url_encode(const unsigned char* data, size_t len);

// Lower-case hex digests
std::string md5_hex(const std::string& data);
std::string sha256_hex(const std::string& data);

} // namespace minim

#ifndef SFERA_CORE_UTILS_HPP
#define SFERA_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sfera {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// Parse "YYYY-MM-DDTHH:MM:SS" (optional trailing Z or fraction) as UTC.
// Returns -1 when the text is not a timestamp.
int64_t parse_timestamp(const std::string& text);

// ============ String utilities ============

std::string trim(const std::string& s);

std::string to_lower(const std::string& s);

std::string to_upper(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace all occurrences of 'from' with 'to'
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Percent-encode everything outside RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Hashing utilities ============

// Compute MD5 hash as hex string
std::string md5_hex(const std::string& data);

} // namespace sfera

#endif // SFERA_CORE_UTILS_HPP

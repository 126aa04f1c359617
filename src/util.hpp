#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace vigil {

// ISO 8601 timestamp
std::string timestamp_now();

// Compact local-time stamp for file names (YYYYmmdd_HHMMSS)
std::string timestamp_for_filename(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// ASCII lower-casing
std::string to_lower(const std::string& s);

// Case-insensitive substring test. An empty needle never matches.
bool contains_ci(const std::string& haystack, const std::string& needle);

// Lower-cased alphanumeric word tokens, in order of appearance
std::vector<std::string> tokenize_words(const std::string& text);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write through a temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// SHA-256 hex digest of a buffer
std::string sha256_hex(const std::string& data);

// SHA-256 hex digest of a file's full content, read in chunks
std::optional<std::string> sha256_file_hex(const std::string& path);

// At most max_bytes, cut on a UTF-8 code point boundary, with control
// characters (except newline/tab) replaced by spaces. Safe to embed in a prompt.
std::string sanitize_excerpt(const std::string& text, size_t max_bytes);

} // namespace vigil

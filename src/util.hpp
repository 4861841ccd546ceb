#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace mcprelay {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// True if s begins with prefix (empty prefix matches everything)
bool starts_with(const std::string& s, const std::string& prefix);

// First max_chars characters of s, with "..." appended when cut
std::string preview(const std::string& s, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file; returns false if it cannot be opened
bool read_file(const std::string& path, std::string& out);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories as needed.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace mcprelay

#ifndef pvfworker_CORE_UTILS_HPP
#define pvfworker_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace pvfworker {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on runs of spaces and tabs, dropping empty fields
std::vector<std::string> split_whitespace(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// strerror() wrapper that is safe to call from several threads
std::string errno_string(int err);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Write `data` to `path`, truncating any previous content.
// On failure returns false and fills `error`.
bool write_file(const std::string& path, const std::vector<uint8_t>& data, std::string& error);

// Remove a directory tree. Missing paths are not an error.
bool remove_tree(const std::string& path);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest of `data`
std::string sha256_hex(const std::vector<uint8_t>& data);

} // namespace pvfworker

#endif // pvfworker_CORE_UTILS_HPP

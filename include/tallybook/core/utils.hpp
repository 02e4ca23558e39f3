#ifndef TALLYBOOK_CORE_UTILS_HPP
#define TALLYBOOK_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace tallybook {

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Parse a whole string as a signed 64-bit integer (no trailing garbage)
bool parse_int64(const std::string& s, int64_t& out);

// ============ Money utilities ============

// Format minor units as "-$1,234.56"
std::string format_money(int64_t minor_units);

// Parse a decimal amount such as "12.34", "-5" or "+0.5" into minor units.
// At most two fractional digits are accepted; no float math is involved.
bool parse_money(const std::string& text, int64_t& minor_units);

// ============ Path utilities ============

// Replace a leading "~/" with $HOME
std::string expand_home(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

} // namespace tallybook

#endif // TALLYBOOK_CORE_UTILS_HPP

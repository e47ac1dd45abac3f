#ifndef SHORTCUT_UTIL_HPP
#define SHORTCUT_UTIL_HPP

#include <string>
#include <vector>

namespace shortcut {

// Lowercase copy (ASCII).
std::string to_lower(std::string s);

// Strip leading/trailing whitespace.
std::string trim(const std::string& s);

// ASCII case-insensitive equality.
bool equals_ignore_case(const std::string& a, const std::string& b);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on delim, trimming each token and dropping empty ones.
std::vector<std::string> split(const std::string& s, char delim);

// Join with a separator, e.g. for diagnostics: "a, b, c".
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace shortcut

#endif // SHORTCUT_UTIL_HPP

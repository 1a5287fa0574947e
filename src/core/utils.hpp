#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <optional>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact local timestamp for generated names: YYYYmmdd-HHMMSS.
std::string now_compact();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict integer parse: the whole string must be an integer.
std::optional<int> parse_int(const std::string& s);

// Split a command line into words using POSIX shell quoting rules
// (single quotes, double quotes, backslash escapes). Returns nullopt on an
// unterminated quote or trailing backslash.
std::optional<std::vector<std::string>> split_command_line(const std::string& line);

// Quote a single word so split_command_line() yields it back unchanged.
std::string shell_quote(const std::string& word);

// Cut text to max_length characters, ending in "..." when shortened.
std::string truncate_text(const std::string& text, size_t max_length);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Instance ids, owner ids and pool names: letters, digits, '-', '_' and '.',
// not starting with '-'. These end up as tool arguments.
bool is_valid_name(const std::string& name);

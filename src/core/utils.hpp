#pragma once

#include <string>
#include <vector>

// HH:MM:SS.mmm for log lines.
std::string now_clock_ms();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Escape regex metacharacters so the text matches literally.
std::string regex_escape(const std::string& text);

// Remove every occurrence of `what`.
std::string erase_all(std::string text, const std::string& what);

std::vector<std::string> split_lines(const std::string& text);

// Printable rendering of terminal text for debug logs (\r, \n, control chars escaped).
std::string printable(const std::string& text, size_t max_len = 200);

#pragma once

#include <string>

// Timestamp for log lines: HH:MM:SS.mmm in local time.
std::string now_clock_ms();

// Timestamp for file names: YYYYmmdd_HHMMSS in local time.
std::string now_file_stamp();

// Shorten s to at most max_chars characters, appending an ellipsis when cut.
std::string truncate_preview(const std::string& s, size_t max_chars);

// True if s contains at least one non-whitespace character.
bool has_visible_text(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

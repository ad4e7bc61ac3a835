#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>

static struct tm local_now(std::chrono::system_clock::time_point now) {
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

std::string now_clock_ms() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf = local_now(now);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return std::string(ts);
}

std::string now_file_stamp() {
    struct tm tm_buf = local_now(std::chrono::system_clock::now());
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm_buf);
    return std::string(buf);
}

std::string truncate_preview(const std::string& s, size_t max_chars) {
    if (s.size() <= max_chars) return s;
    // Back off to a UTF-8 lead byte so we never split a code point
    size_t cut = max_chars;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut) + "\xe2\x80\xa6";
}

bool has_visible_text(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") != std::string::npos;
}

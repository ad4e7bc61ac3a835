#include "text_sanitizer.hpp"
#include <core/utils.hpp>
#include <regex>

// ── Terminal control sequences ─────────────────────────────────

// One left-to-right pass. A sequence that only forms once an inner one is
// gone is caught by the next pass.
static std::string strip_control_once(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t len = s.size();
    for (size_t i = 0; i < len; ) {
        if (s[i] != '\033' || i + 1 >= len) {
            out += s[i++];
            continue;
        }
        char kind = s[i + 1];
        if (kind == '[') {
            // CSI: parameters, intermediates, one final byte
            size_t j = i + 2;
            while (j < len && ((s[j] >= '0' && s[j] <= '9') || s[j] == ';' || s[j] == '?'))
                j++;
            while (j < len && s[j] >= ' ' && s[j] <= '/')
                j++;
            if (j < len && s[j] >= '@' && s[j] <= '~') {
                i = j + 1;
                continue;
            }
        } else if (kind == ']') {
            // OSC: terminated by BEL or ST (ESC \)
            size_t j = i + 2;
            while (j < len && s[j] != '\a' && s[j] != '\033')
                j++;
            if (j < len && s[j] == '\a') {
                i = j + 1;
                continue;
            }
            if (j + 1 < len && s[j + 1] == '\\') {
                i = j + 2;
                continue;
            }
        } else if (kind == '7' || kind == '8') {
            // save / restore cursor
            i += 2;
            continue;
        }
        out += s[i++];
    }
    return out;
}

std::string strip_terminal_control(const std::string& text) {
    std::string out = text;
    while (true) {
        std::string next = strip_control_once(out);
        if (next == out) return out;
        out.swap(next);
    }
}

// ── Transient status noise ─────────────────────────────────────

// Braille spinner frames plus the star/quarter-circle sets some builds use.
static const std::string SPINNER_GLYPHS =
    "\xe2\xa0\x8b|\xe2\xa0\x99|\xe2\xa0\xb9|\xe2\xa0\xb8|\xe2\xa0\xbc|"
    "\xe2\xa0\xb4|\xe2\xa0\xa6|\xe2\xa0\xa7|\xe2\xa0\x87|\xe2\xa0\x8f|"
    "\xe2\xa3\xbe|\xe2\xa3\xbd|\xe2\xa3\xbb|\xe2\xa2\xbf|\xe2\xa1\xbf|"
    "\xe2\xa3\x9f|\xe2\xa3\xaf|\xe2\xa3\xb7|"
    "\xe2\x9c\xb6|\xe2\x9c\xbb|\xe2\x9c\xbd|\xe2\x9c\xa2|"
    "\xe2\x97\x90|\xe2\x97\x93|\xe2\x97\x91|\xe2\x97\x92";

// • ● · ∙ ◦ ▪
static const std::string BULLET_GLYPHS =
    "\xe2\x80\xa2|\xe2\x97\x8f|\xc2\xb7|\xe2\x88\x99|\xe2\x97\xa6|\xe2\x96\xaa";

static const std::string ELLIPSIS = "\xe2\x80\xa6";
static const std::string PROMPT_ARROW = "\xe2\x9d\xaf";

static const std::string SPIN = "(?:" + SPINNER_GLYPHS + ")";
static const std::string BULLET = "(?:" + BULLET_GLYPHS + ")";
static const std::string FILL = "(?:" + SPINNER_GLYPHS + "|" + BULLET_GLYPHS + "|" + ELLIPSIS +
                                "|" + PROMPT_ARROW + "|[[:punct:][:space:]])";

static constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

// (a) one or more thinking tokens, optionally among spinners/bullets/punctuation
static const std::regex& thinking_line_regex() {
    static const std::regex re("^" + FILL + "*(?:thinking" + FILL + "*)+$", ICASE);
    return re;
}

// (b) a partial redraw: only letters from "thinking", then punctuation
static const std::regex& thinking_fragment_regex() {
    static const std::regex re("^[thinkg]+(?:[[:punct:]]|" + ELLIPSIS + ")*$", ICASE);
    return re;
}

// (c) nothing but glyphs, punctuation and the prompt arrow
static const std::regex& glyph_line_regex() {
    static const std::regex re("^" + FILL + "+$");
    return re;
}

static const std::regex& glyph_marker_regex() {
    static const std::regex re(SPIN + "|" + BULLET);
    return re;
}

// Spinner+token runs inside a line, or bare repeated tokens, plus the
// prompt arrow the program redraws right after them.
static const std::regex& inline_run_regex() {
    static const std::regex re(
        "(?:(?:" + SPIN + "[ \\t]*thinking(?:\\.+|" + ELLIPSIS + ")?[ \\t]*)+"
        "|(?:thinking(?:\\.+|" + ELLIPSIS + ")[ \\t]*){2,})"
        "(?:(?:>|" + PROMPT_ARROW + ")[ \\t]*)?",
        ICASE);
    return re;
}

static constexpr size_t kMaxFragmentLen = 10;

// Status redraws are short. Longer lines are left to the inline rule, which
// also keeps the whole-line patterns from recursing once per character.
static constexpr size_t kMaxStatusLineLen = 240;

// Longer lines are passed through untouched by the inline rule as well.
static constexpr size_t kMaxInlineScanLen = 4096;

bool is_transient_status_line(const std::string& line) {
    std::string t = trimmed(line);
    if (t.empty() || t.size() > kMaxStatusLineLen) return false;

    if (std::regex_match(t, thinking_line_regex())) return true;
    if (t.size() <= kMaxFragmentLen && std::regex_match(t, thinking_fragment_regex())) return true;
    if (std::regex_match(t, glyph_line_regex()) && std::regex_search(t, glyph_marker_regex())) {
        return true;
    }
    return false;
}

std::string filter_transient_status(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    // Blank lines are held back until we know how long the run is.
    std::string blanks;
    int blank_count = 0;
    auto flush_blanks = [&] {
        if (blank_count >= 3) {
            out += "\n";
        } else {
            out += blanks;
        }
        blanks.clear();
        blank_count = 0;
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        bool has_nl = nl != std::string::npos;
        std::string line = text.substr(pos, has_nl ? nl - pos : std::string::npos);
        pos = has_nl ? nl + 1 : text.size();

        if (!has_visible_text(line)) {
            blanks += line;
            if (has_nl) blanks += "\n";
            ++blank_count;
            continue;
        }

        if (is_transient_status_line(line)) continue;

        std::string cleaned = line.size() > kMaxInlineScanLen
                                  ? line
                                  : std::regex_replace(line, inline_run_regex(), "");
        if (!has_visible_text(cleaned)) continue;

        flush_blanks();
        out += cleaned;
        if (has_nl) out += "\n";
    }
    flush_blanks();
    return out;
}

#include "patterns.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

static constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

// Group 1 is the line break in front of the prompt line (empty at offset 0).
static const std::regex& idle_prompt_regex() {
    static const std::regex re(R"((^|\n)[ \t\r]*(?:Amazon Q>|>)[ \t\r]*(?=\n|$))");
    return re;
}

// Group 1 is the prompt glyph and the blanks after it.
static const std::regex& leading_prompt_regex() {
    static const std::regex re(R"(^[ \t\r\n]*((?:Amazon Q>|>)[ \t]*))");
    return re;
}

static const std::regex& bracketed_permission_regex() {
    static const std::regex re(R"(\[y/n(?:/t)?\]:)", ICASE);
    return re;
}

static const std::regex& start_chatting_regex() {
    static const std::regex re(R"(ctrl.?\+?c to start chatting)", ICASE);
    return re;
}

// Phrases that may sit far apart are located with find() on a lowercased
// copy; std::regex recursion grows with the distance between them.
static std::string lowercase(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static constexpr const char* NARRATIVE_OPENING = "allow this action?";
static constexpr const char* NARRATIVE_CLOSING = "use 't' to trust";

static PatternMatch search(const std::string& text, const std::regex& re) {
    PatternMatch result;
    std::smatch m;
    if (std::regex_search(text, m, re)) {
        result.matched = true;
        result.position = static_cast<size_t>(m.position(0));
        result.matched_text = m.str(0);
    }
    return result;
}

PatternMatch find_idle_prompt(const std::string& text) {
    PatternMatch result;
    std::smatch m;
    if (std::regex_search(text, m, idle_prompt_regex())) {
        size_t lead = static_cast<size_t>(m.length(1));
        result.matched = true;
        result.position = static_cast<size_t>(m.position(0)) + lead;
        result.matched_text = m.str(0).substr(lead);
    }
    return result;
}

PatternMatch find_idle_prompt(const std::string& text, size_t from) {
    // Start at the line break in front of `from` so a line start is still seen
    size_t base = 0;
    if (from > 0) {
        size_t nl = text.rfind('\n', from - 1);
        if (nl != std::string::npos) base = nl;
    }
    while (base < text.size()) {
        PatternMatch m = find_idle_prompt(text.substr(base));
        if (!m.matched) break;
        m.position += base;
        if (m.position >= from) return m;
        base = m.position + m.matched_text.size();
    }
    return PatternMatch{};
}

PatternMatch find_leading_prompt(const std::string& text) {
    PatternMatch result;
    std::smatch m;
    if (std::regex_search(text, m, leading_prompt_regex())) {
        result.matched = true;
        result.position = static_cast<size_t>(m.position(1));
        result.matched_text = m.str(1);
    }
    return result;
}

PatternMatch find_bracketed_permission(const std::string& text) {
    return search(text, bracketed_permission_regex());
}

PatternMatch find_narrative_permission(const std::string& text) {
    PatternMatch result;
    std::string lower = lowercase(text);
    const std::string opening = NARRATIVE_OPENING;
    const std::string closing = NARRATIVE_CLOSING;

    size_t start = lower.find(opening);
    if (start == std::string::npos) return result;
    size_t close = lower.find(closing, start + opening.size());
    if (close == std::string::npos) return result;

    // Shortest match: the opening nearest to the closing phrase
    start = lower.rfind(opening, close - opening.size());
    size_t end = close + closing.size();
    result.matched = true;
    result.position = start;
    result.matched_text = text.substr(start, end - start);
    return result;
}

PatternMatch find_narrative_opening(const std::string& text) {
    PatternMatch result;
    size_t pos = lowercase(text).rfind(NARRATIVE_OPENING);
    if (pos == std::string::npos) return result;
    result.matched = true;
    result.position = pos;
    result.matched_text = text.substr(pos, std::string(NARRATIVE_OPENING).size());
    return result;
}

PatternMatch find_permission_prompt(const std::string& text) {
    PatternMatch narrative = find_narrative_permission(text);
    PatternMatch bracketed = find_bracketed_permission(text);
    if (narrative.matched && bracketed.matched) {
        return bracketed.position < narrative.position ? bracketed : narrative;
    }
    return narrative.matched ? narrative : bracketed;
}

bool is_start_chatting_notice(const std::string& text) {
    return std::regex_search(text, start_chatting_regex());
}

bool is_legacy_profile_question(const std::string& text) {
    std::string lower = lowercase(text);
    size_t pos = lower.find("legacy profiles detected");
    while (pos != std::string::npos) {
        size_t eol = lower.find('\n', pos);
        size_t hit = lower.find("migrate", pos);
        if (hit != std::string::npos && (eol == std::string::npos || hit < eol)) return true;
        pos = lower.find("legacy profiles detected", pos + 1);
    }
    return false;
}

std::vector<std::string> echo_candidates(const std::string& sent) {
    const std::string long_prefix = std::string(PROMPT_LONG) + " ";
    const std::string short_prefix = std::string(PROMPT_SHORT) + " ";

    std::vector<std::string> out;
    for (const auto& prefix : {long_prefix, short_prefix, std::string()}) {
        out.push_back(prefix + sent + "\r\n");
        out.push_back(prefix + sent + "\n");
        out.push_back(prefix + sent);
    }
    return out;
}

PatternMatch find_input_echo(const std::string& text, const std::string& sent) {
    PatternMatch result;
    if (text.empty() || sent.empty()) return result;
    for (const auto& candidate : echo_candidates(sent)) {
        auto idx = text.find(candidate);
        if (idx != std::string::npos) {
            result.matched = true;
            result.position = idx;
            result.matched_text = candidate;
            return result;
        }
    }
    return result;
}

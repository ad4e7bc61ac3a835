#pragma once

#include <string>
#include <vector>

// Recognizers for the chat program's free-form output. All of them run on
// text that has already been through strip_terminal_control().

struct PatternMatch {
    bool matched = false;
    size_t position = 0;        // offset of the match in the searched text
    std::string matched_text;
};

// Idle prompt: a line holding only "Amazon Q>" or ">" (surrounding
// whitespace allowed). position is the start of the line the prompt sits
// on; a prompt glyph inside a line of other text never matches.
PatternMatch find_idle_prompt(const std::string& text);

// First idle prompt whose line starts at or after `from`. Prompt lines
// that start before it are skipped.
PatternMatch find_idle_prompt(const std::string& text, size_t from);

// A prompt glyph opening the first non-blank line of text, whether or not
// more text follows it on that line. matched_text is the glyph plus the
// blanks after it.
PatternMatch find_leading_prompt(const std::string& text);

// "[y/n]:" or "[y/n/t]:", any case.
PatternMatch find_bracketed_permission(const std::string& text);

// "Allow this action?" ... "Use 't' to trust", any case, possibly across
// lines. The match starts at the opening nearest the closing phrase.
PatternMatch find_narrative_permission(const std::string& text);

// Last "Allow this action?" in text, any case, whether or not the rest of
// the narrative prompt has arrived yet.
PatternMatch find_narrative_opening(const std::string& text);

// Either permission idiom; the one that starts earliest wins.
PatternMatch find_permission_prompt(const std::string& text);

// Startup interstitials shown before the first prompt on some installs.
bool is_start_chatting_notice(const std::string& text);     // "... ctrl+c to start chatting"
bool is_legacy_profile_question(const std::string& text);   // "Legacy profiles detected ... migrate"

// Literal forms in which the program may echo a line we just sent,
// longest first so a prompt-prefixed echo wins over the bare text.
std::vector<std::string> echo_candidates(const std::string& sent);

// First occurrence of the first echo candidate found in text.
PatternMatch find_input_echo(const std::string& text, const std::string& sent);

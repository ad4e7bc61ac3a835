#pragma once

#include <string>

// Text cleanup for raw chat output. Pure functions, safe on any input.

// Remove CSI sequences (cursor movement, colors), OSC sequences terminated
// by BEL or ST, and ESC 7 / ESC 8 (save/restore cursor). Idempotent:
// removal is repeated until nothing matches, so sequences that only form
// once an inner one is removed are also gone. Unrecognized escapes stay.
std::string strip_terminal_control(const std::string& text);

// Remove the animated "Thinking..." indicator the chat program redraws
// while it works:
//   - whole lines that are only thinking tokens (with spinner glyphs,
//     bullets and punctuation around them),
//   - short redraw fragments made of letters from "thinking" ("Thi", "nki.."),
//   - whole lines of spinner glyphs / bullets / punctuation / prompt arrow
//     that contain at least one spinner or bullet glyph,
//   - inline spinner+"Thinking" runs in the middle of a line.
// Runs of 3+ blank lines collapse to a single blank line.
//
// The glyph-line rule is deliberately narrower than "glyphs, bullets,
// punctuation and prompt arrow only": without a spinner or bullet glyph
// the line is kept, so code such as "}" or "---" survives. The whole-line
// rules only look at lines up to a few hundred bytes.
std::string filter_transient_status(const std::string& text);

// Single-line predicate behind filter_transient_status().
bool is_transient_status_line(const std::string& line);

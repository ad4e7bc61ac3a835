#include <gtest/gtest.h>
#include <chat/text_sanitizer.hpp>

// ⠋ ⠙ •
static const std::string SPIN_A = "\xe2\xa0\x8b";
static const std::string SPIN_B = "\xe2\xa0\x99";
static const std::string BULLET = "\xe2\x80\xa2";

TEST(StripControl, RemovesColorCodes) {
    EXPECT_EQ(strip_terminal_control("\x1b[31mred\x1b[0m text"), "red text");
}

TEST(StripControl, RemovesCursorMovement) {
    EXPECT_EQ(strip_terminal_control("\x1b[2K\x1b[1Gline\x1b[?25l"), "line");
}

TEST(StripControl, RemovesOscWithBell) {
    EXPECT_EQ(strip_terminal_control("\x1b]0;window title\x07hello"), "hello");
}

TEST(StripControl, RemovesOscWithStringTerminator) {
    EXPECT_EQ(strip_terminal_control("\x1b]8;;http://x\x1b\\link"), "link");
}

TEST(StripControl, RemovesSaveRestoreCursor) {
    EXPECT_EQ(strip_terminal_control("\x1b" "7abc\x1b" "8"), "abc");
}

TEST(StripControl, NestedSequencesAreFullyRemoved) {
    // Removing the inner CSI leaves another CSI behind
    std::string nested = "\x1b\x1b[0m[31mX";
    EXPECT_EQ(strip_terminal_control(nested), "X");
}

TEST(StripControl, Idempotent) {
    std::string inputs[] = {
        "\x1b[1mbold\x1b[0m",
        "\x1b\x1b[0m[31mX",
        "plain text",
        "\x1b]0;t\x07\x1b[2Jdone",
        "\x1bZ unknown",
    };
    for (const auto& in : inputs) {
        std::string once = strip_terminal_control(in);
        EXPECT_EQ(strip_terminal_control(once), once);
    }
}

TEST(StripControl, UnknownEscapeIsKept) {
    EXPECT_EQ(strip_terminal_control("\x1bZ ok"), "\x1bZ ok");
}

TEST(StripControl, EmptyInput) {
    EXPECT_EQ(strip_terminal_control(""), "");
}

TEST(TransientStatus, DropsSpinnerThinkingLines) {
    std::string text = SPIN_A + " Thinking...\n" + SPIN_B + " Thinking...\ndone\n";
    EXPECT_EQ(filter_transient_status(text), "done\n");
}

TEST(TransientStatus, DropsRepeatedThinkingTokens) {
    EXPECT_EQ(filter_transient_status("Thinking... Thinking... thinking\nok\n"), "ok\n");
}

TEST(TransientStatus, DropsShortRedrawFragments) {
    EXPECT_TRUE(is_transient_status_line("Thi"));
    EXPECT_TRUE(is_transient_status_line("nki.."));
    EXPECT_TRUE(is_transient_status_line("  king...  "));
    EXPECT_EQ(filter_transient_status("Thin\nanswer\n"), "answer\n");
}

TEST(TransientStatus, DropsGlyphOnlyLines) {
    EXPECT_TRUE(is_transient_status_line(BULLET + " " + BULLET + " " + BULLET));
    EXPECT_TRUE(is_transient_status_line(SPIN_A));
}

TEST(TransientStatus, KeepsPunctuationOnlyCodeLines) {
    EXPECT_FALSE(is_transient_status_line("}"));
    EXPECT_FALSE(is_transient_status_line("---"));
    EXPECT_EQ(filter_transient_status("int f() {\n}\n"), "int f() {\n}\n");
}

TEST(TransientStatus, KeepsOrdinaryText) {
    EXPECT_FALSE(is_transient_status_line("I am thinking about it"));
    EXPECT_FALSE(is_transient_status_line("Here is the plan."));
    EXPECT_FALSE(is_transient_status_line(""));
}

TEST(TransientStatus, RemovesInlineSpinnerRuns) {
    std::string text = "Answer: " + SPIN_A + " Thinking... " + SPIN_B + " Thinking... 42\n";
    EXPECT_EQ(filter_transient_status(text), "Answer: 42\n");
}

TEST(TransientStatus, LineEmptiedByInlineRunIsDropped) {
    std::string text = SPIN_A + " Thinking... > \nreal\n";
    EXPECT_EQ(filter_transient_status(text), "real\n");
}

TEST(TransientStatus, CollapsesLongBlankRuns) {
    EXPECT_EQ(filter_transient_status("a\n\n\n\nb\n"), "a\n\nb\n");
    EXPECT_EQ(filter_transient_status("a\n\n\n\n\n\n\nb\n"), "a\n\nb\n");
}

TEST(TransientStatus, KeepsShortBlankRuns) {
    EXPECT_EQ(filter_transient_status("a\n\nb\n"), "a\n\nb\n");
    EXPECT_EQ(filter_transient_status("a\n\n\nb\n"), "a\n\n\nb\n");
}

TEST(TransientStatus, CleanTextUnchanged) {
    std::string text = "Hello world\nSecond line\n  indented\n";
    EXPECT_EQ(filter_transient_status(text), text);
}

TEST(TransientStatus, KeepsUnterminatedLastLine) {
    EXPECT_EQ(filter_transient_status("partial"), "partial");
}

TEST(TransientStatus, SpinnerRunBeforeReply) {
    std::string text = SPIN_A + " Thinking... " + SPIN_B + " Thinking... > done\n";
    EXPECT_EQ(filter_transient_status(text), "done\n");
}

TEST(TransientStatus, VeryLongLinesPassThrough) {
    std::string dashes = std::string(100000, '-') + " x\n";
    EXPECT_EQ(filter_transient_status(dashes), dashes);

    std::string glyphs = std::string(100000, '.') + SPIN_A + "\n";
    EXPECT_EQ(filter_transient_status(glyphs), glyphs);
}

TEST(StripControl, UnterminatedOscOverLongTextIsKept) {
    std::string text = "\x1b]0;" + std::string(100000, 'x');
    EXPECT_EQ(strip_terminal_control(text), text);
    EXPECT_EQ(strip_terminal_control("\x1b[31m" + text), text);
}

#include <gtest/gtest.h>
#include <chat/patterns.hpp>

TEST(IdlePrompt, ShortPromptAfterText) {
    auto m = find_idle_prompt("Hello\n> ");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 6u);
}

TEST(IdlePrompt, LongPromptAtStart) {
    auto m = find_idle_prompt("Amazon Q>");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 0u);
}

TEST(IdlePrompt, PromptLineWithCarriageReturn) {
    auto m = find_idle_prompt("reply\n  Amazon Q> \r\nmore");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 6u);
}

TEST(IdlePrompt, GlyphInsideTextDoesNotMatch) {
    EXPECT_FALSE(find_idle_prompt("if a > b then\n").matched);
    EXPECT_FALSE(find_idle_prompt("> quoted reply\n").matched);
    EXPECT_FALSE(find_idle_prompt("x>\n").matched);
    EXPECT_FALSE(find_idle_prompt("").matched);
}

TEST(Permission, BracketedAnyCase) {
    EXPECT_TRUE(find_bracketed_permission("Proceed? [y/n]:").matched);
    EXPECT_TRUE(find_bracketed_permission("Proceed? [Y/N/T]:").matched);
    EXPECT_FALSE(find_bracketed_permission("Proceed? [y/n]").matched);
}

TEST(Permission, Narrative) {
    std::string text = "Allow this action? Use 't' to trust (always allow) this tool for the session.";
    auto m = find_narrative_permission(text);
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 0u);
    EXPECT_EQ(m.matched_text, "Allow this action? Use 't' to trust");
}

TEST(Permission, NarrativeSpansLines) {
    auto m = find_narrative_permission("Tool: fs_write\nallow this action?\nUse 't' to trust\n");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 15u);
}

TEST(Permission, EarliestMatchWins) {
    std::string narrative_first =
        "Allow this action? Use 't' to trust (always allow) this tool. [y/n/t]:";
    auto a = find_permission_prompt(narrative_first);
    ASSERT_TRUE(a.matched);
    EXPECT_EQ(a.position, 0u);

    std::string bracketed_first = "Run it? [y/n]:\nAllow this action? Use 't' to trust";
    auto b = find_permission_prompt(bracketed_first);
    ASSERT_TRUE(b.matched);
    EXPECT_EQ(b.position, 8u);
    EXPECT_EQ(b.matched_text, "[y/n]:");
}

TEST(Permission, NoPrompt) {
    EXPECT_FALSE(find_permission_prompt("just an answer\n").matched);
}

TEST(Interstitials, StartChattingNotice) {
    EXPECT_TRUE(is_start_chatting_notice("Press ctrl+c to start chatting"));
    EXPECT_TRUE(is_start_chatting_notice("CTRL-C to start chatting"));
    EXPECT_FALSE(is_start_chatting_notice("start chatting"));
}

TEST(Interstitials, LegacyProfileQuestion) {
    EXPECT_TRUE(is_legacy_profile_question("Legacy profiles detected. Would you like to migrate them?"));
    EXPECT_FALSE(is_legacy_profile_question("Profiles loaded"));
}

TEST(InputEcho, CandidatesLongestPrefixFirst) {
    auto c = echo_candidates("hi");
    ASSERT_EQ(c.size(), 9u);
    EXPECT_EQ(c.front(), "Amazon Q> hi\r\n");
    EXPECT_EQ(c[3], "> hi\r\n");
    EXPECT_EQ(c.back(), "hi");
}

TEST(InputEcho, PromptPrefixedEchoWins) {
    auto a = find_input_echo("Amazon Q> Hi\nHi there\n", "Hi");
    ASSERT_TRUE(a.matched);
    EXPECT_EQ(a.position, 0u);
    EXPECT_EQ(a.matched_text, "Amazon Q> Hi\n");

    auto b = find_input_echo("> Hi\r\nHi there\n", "Hi");
    ASSERT_TRUE(b.matched);
    EXPECT_EQ(b.matched_text, "> Hi\r\n");
}

TEST(InputEcho, FirstOccurrenceOnly) {
    auto m = find_input_echo("Hi\nHi\n", "Hi");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 0u);
    EXPECT_EQ(m.matched_text, "Hi\n");
}

TEST(InputEcho, NoEcho) {
    EXPECT_FALSE(find_input_echo("Hello back\n", "question").matched);
    EXPECT_FALSE(find_input_echo("", "Hi").matched);
}

TEST(IdlePrompt, SearchFromOffsetSkipsEarlierPrompts) {
    std::string text = "question\n> \nanswer\n> ";
    auto first = find_idle_prompt(text, 0);
    ASSERT_TRUE(first.matched);
    EXPECT_EQ(first.position, 9u);

    auto later = find_idle_prompt(text, 11);
    ASSERT_TRUE(later.matched);
    EXPECT_EQ(later.position, 19u);

    EXPECT_FALSE(find_idle_prompt(text, 20).matched);
}

TEST(IdlePrompt, LeadingPromptWithOrWithoutText) {
    auto bare = find_leading_prompt("\n> ");
    ASSERT_TRUE(bare.matched);
    EXPECT_EQ(bare.position, 1u);
    EXPECT_EQ(bare.matched_text, "> ");

    auto joined = find_leading_prompt("Amazon Q> Created notes.txt\n");
    ASSERT_TRUE(joined.matched);
    EXPECT_EQ(joined.position, 0u);
    EXPECT_EQ(joined.matched_text, "Amazon Q> ");

    EXPECT_FALSE(find_leading_prompt("Created notes.txt\n> ").matched);
    EXPECT_FALSE(find_leading_prompt("\n").matched);
}

TEST(Permission, NarrativeOpeningAlone) {
    auto m = find_narrative_opening("Saving.\nALLOW THIS ACTION?\n");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 8u);
    EXPECT_EQ(m.matched_text, "ALLOW THIS ACTION?");
    EXPECT_FALSE(find_narrative_permission("Saving.\nALLOW THIS ACTION?\n").matched);
}

TEST(Permission, NarrativeUsesOpeningNearestTheClosing) {
    auto m = find_narrative_permission("Allow this action? was asked before.\nAllow this action? Use 't' to trust");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 37u);
}

TEST(Permission, LongLinesDoNotMatch) {
    std::string opening = "Allow this action?\n" + std::string(100000, 'x');
    EXPECT_FALSE(find_permission_prompt(opening).matched);

    auto m = find_permission_prompt(opening + " Use 't' to trust");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 0u);
}

TEST(Interstitials, LegacyProfileQuestionNeedsOneLine) {
    EXPECT_TRUE(is_legacy_profile_question("LEGACY PROFILES DETECTED, migrate now?"));
    EXPECT_FALSE(is_legacy_profile_question("Legacy profiles detected.\nmigrate"));
    EXPECT_FALSE(is_legacy_profile_question(std::string(100000, 'x') + "Legacy profiles detected"));
}

TEST(InputEcho, FindReportsPositionAndForm) {
    auto m = find_input_echo("noise\n> Hi\nHi there\n", "Hi");
    ASSERT_TRUE(m.matched);
    EXPECT_EQ(m.position, 6u);
    EXPECT_EQ(m.matched_text, "> Hi\n");
    EXPECT_FALSE(find_input_echo("Hello\n", "").matched);
}

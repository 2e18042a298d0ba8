// test_reflow_sentence_gtest.cpp - Sentence splitting and abbreviations

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "../mdlint/reflow/reflow_sentence.hpp"

using namespace mdlint;

class SentenceTest : public ::testing::Test {
protected:
    std::vector<std::string> split(const std::string& text) {
        return split_into_sentences(text, abbreviations);
    }

    bool after_end(const std::string& text, size_t pos) {
        return is_after_sentence_ending(text.data(), text.size(), pos, abbreviations);
    }

    bool ends(const std::string& line) {
        return line_ends_sentence(line.data(), line.size(), abbreviations);
    }

    AbbreviationSet abbreviations;
};

// ============================================================================
// Abbreviations
// ============================================================================

TEST_F(SentenceTest, BuiltinAbbreviations) {
    EXPECT_TRUE(abbreviations.contains("Dr"));
    EXPECT_TRUE(abbreviations.contains("dr."));
    EXPECT_TRUE(abbreviations.contains("MRS"));
    EXPECT_TRUE(abbreviations.contains("I.E."));
    EXPECT_TRUE(abbreviations.contains("e.g"));
    EXPECT_FALSE(abbreviations.contains("paradigms"));
    EXPECT_FALSE(abbreviations.contains("etc"));
    EXPECT_FALSE(abbreviations.contains(""));
}

TEST_F(SentenceTest, UserAbbreviationsAreMerged) {
    AbbreviationSet extended(std::vector<std::string>{"Fig.", "etc", " Inc. ", ""});
    EXPECT_EQ(extended.size(), abbreviations.size() + 3);
    EXPECT_TRUE(extended.contains("fig"));
    EXPECT_TRUE(extended.contains("ETC."));
    EXPECT_TRUE(extended.contains("inc"));
    EXPECT_TRUE(extended.contains("Dr"));
}

// ============================================================================
// Splitting
// ============================================================================

TEST_F(SentenceTest, WordEndingInAbbreviationLettersStillEndsSentence) {
    std::vector<std::string> s = split("Why doesn't `mdlint` like the word paradigms? Next sentence.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Why doesn't `mdlint` like the word paradigms?");
    EXPECT_EQ(s[1], "Next sentence.");

    EXPECT_EQ(split("These are operating systems. They run.").size(), 2u);
    EXPECT_EQ(split("Pick a vertex. Then an edge.").size(), 2u);
    EXPECT_EQ(split("Choose the paradigms. Next one.").size(), 2u);
}

TEST_F(SentenceTest, TrueAbbreviationDoesNotEndSentence) {
    std::vector<std::string> s = split("Talk to Dr. Smith. He is helpful.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Talk to Dr. Smith.");
    EXPECT_EQ(s[1], "He is helpful.");

    EXPECT_EQ(split("Use a tool, e.g. This one works.").size(), 1u);
    EXPECT_EQ(split("Ask (Mr. Jones) about it.").size(), 1u);
}

TEST_F(SentenceTest, UserAbbreviation) {
    EXPECT_EQ(split("See Fig. Three here. Next one.").size(), 3u);
    AbbreviationSet extended(std::vector<std::string>{"fig"});
    EXPECT_EQ(split_into_sentences("See Fig. Three here. Next one.", extended).size(), 2u);
}

TEST_F(SentenceTest, ExclamationAndQuestion) {
    std::vector<std::string> s = split("Hello world! How are you? Fine.");
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0], "Hello world!");
    EXPECT_EQ(s[1], "How are you?");
    EXPECT_EQ(s[2], "Fine.");
}

TEST_F(SentenceTest, NeedsUppercaseAfterTerminator) {
    EXPECT_EQ(split("Done. then more words.").size(), 1u);
    EXPECT_EQ(split("Value is 3.14 today. Next.").size(), 2u);
    EXPECT_EQ(split("No space.Next").size(), 1u);
}

TEST_F(SentenceTest, ClosingQuotesStayWithTheirSentence) {
    std::vector<std::string> s = split("I said \"Stop.\" Then I left.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "I said \"Stop.\"");

    s = split("He wrote \xE2\x80\x9C" "Done.\xE2\x80\x9D \xE2\x80\x9C" "Next\xE2\x80\x9D came.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "He wrote \xE2\x80\x9C" "Done.\xE2\x80\x9D");
}

TEST_F(SentenceTest, Ellipsis) {
    std::vector<std::string> s = split("Wait... Then it came.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Wait...");
    EXPECT_EQ(split("Wait...then it came.").size(), 1u);
}

TEST_F(SentenceTest, Cjk) {
    std::vector<std::string> s = split("第一句话。第二句话。");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "第一句话。");
    EXPECT_EQ(s[1], "第二句话。");

    EXPECT_EQ(split("你好！再见？好的。").size(), 3u);
    // an uppercase-less script still starts a sentence after a Latin terminator
    EXPECT_EQ(split("It ended. 次の文。").size(), 2u);
}

TEST_F(SentenceTest, ProtectedSpansAreOpaque) {
    std::vector<std::string> s = split("Run `a. B` now. Next.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Run `a. B` now.");

    s = split("[Go. Now](x) and more. End.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "[Go. Now](x) and more.");

    EXPECT_EQ(split("Before {{< hint \"A. B\" >}} after. Next.").size(), 2u);
}

TEST_F(SentenceTest, EmphasisEndingInTerminator) {
    std::vector<std::string> s = split("*First one.* Second one.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "*First one.*");
    EXPECT_EQ(s[1], "Second one.");

    // the interior of an emphasis is not split at this level
    EXPECT_EQ(split("**One. Two.** Three.").size(), 2u);
}

TEST_F(SentenceTest, RangesAreTrimmed) {
    std::string text = "  One here.   Two here.  ";
    std::vector<ByteRange> ranges = split_sentence_ranges(text.data(), 0, text.size(), abbreviations, NULL);
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(text.substr(ranges[0].begin, ranges[0].end - ranges[0].begin), "One here.");
    EXPECT_EQ(text.substr(ranges[1].begin, ranges[1].end - ranges[1].begin), "Two here.");
    EXPECT_TRUE(split_sentence_ranges(text.data(), 0, 2, abbreviations, NULL).empty());
}

// ============================================================================
// Backward checks
// ============================================================================

TEST_F(SentenceTest, TextEndsWithAbbreviation) {
    EXPECT_TRUE(text_ends_with_abbreviation("Talk to Dr.", abbreviations));
    EXPECT_TRUE(text_ends_with_abbreviation("for example e.g. ", abbreviations));
    EXPECT_FALSE(text_ends_with_abbreviation("The end.", abbreviations));
    EXPECT_FALSE(text_ends_with_abbreviation("paradigms.", abbreviations));
    EXPECT_FALSE(text_ends_with_abbreviation("Dr", abbreviations));
}

TEST_F(SentenceTest, LineEndsSentence) {
    EXPECT_TRUE(ends("Hello world."));
    EXPECT_TRUE(ends("Hello **world.**"));
    EXPECT_TRUE(ends("She said \"go.\"  "));
    EXPECT_TRUE(ends("Really?"));
    EXPECT_TRUE(ends("第一句话。"));
    EXPECT_FALSE(ends("Ask Mr."));
    EXPECT_FALSE(ends("No ending here"));
    EXPECT_FALSE(ends(""));
}

TEST_F(SentenceTest, IsAfterSentenceEnding) {
    EXPECT_TRUE(after_end("Hello. World", 7));
    EXPECT_TRUE(after_end("Really?! Yes", 9));
    EXPECT_TRUE(after_end("(see above.) Next", 13));
    EXPECT_TRUE(after_end("Wait... Next", 8));
    EXPECT_FALSE(after_end("Dr. Smith", 4));
    EXPECT_FALSE(after_end("J. Smith", 3));
    EXPECT_FALSE(after_end("hello world", 6));
    EXPECT_FALSE(after_end("3.14", 2));
    EXPECT_FALSE(after_end("x", 0));

    std::string cjk = "第一句。第二";
    EXPECT_TRUE(after_end(cjk, 12));
}

TEST_F(SentenceTest, CharacterClasses) {
    EXPECT_TRUE(is_cjk_char(0x4E2D));
    EXPECT_TRUE(is_cjk_char(0x3042));
    EXPECT_TRUE(is_cjk_char(0xAC00));
    EXPECT_FALSE(is_cjk_char('A'));
    EXPECT_TRUE(is_cjk_sentence_ending(0x3002));
    EXPECT_TRUE(is_cjk_sentence_ending(0xFF1F));
    EXPECT_FALSE(is_cjk_sentence_ending('.'));
    EXPECT_TRUE(is_closing_quote(0x201D));
    EXPECT_TRUE(is_opening_quote(0x00AB));
    EXPECT_FALSE(is_opening_quote(0x00BB));
}

// ============================================================================
// Linear time
// ============================================================================

TEST_F(SentenceTest, AdversarialInputsFinishQuickly) {
    const size_t n = 60000;
    std::vector<std::string> inputs = {std::string(n, '.'), std::string(n, '!'), std::string(n, ' ')};
    std::string abbrevs, initials, quotes;
    for (size_t i = 0; i < n / 4; i++) abbrevs += "Dr. ";
    for (size_t i = 0; i < n / 3; i++) initials += "A. ";
    for (size_t i = 0; i < n / 4; i++) quotes += ".\"* ";
    inputs.push_back(abbrevs);
    inputs.push_back(initials);
    inputs.push_back(quotes);

    for (const std::string& input : inputs) {
        auto start = std::chrono::steady_clock::now();
        std::vector<std::string> sentences = split(input);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        EXPECT_LT(elapsed.count(), 2000) << input.substr(0, 12);
        EXPECT_LE(sentences.size(), input.size());
    }
}

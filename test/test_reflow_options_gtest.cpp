// test_reflow_options_gtest.cpp - Reflow option defaults and name parsing

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../mdlint/reflow/reflow_options.hpp"

using namespace mdlint;

TEST(ReflowOptionsTest, Defaults) {
    ReflowOptions options = ReflowOptions::defaults();
    EXPECT_EQ(options.line_length, 80u);
    EXPECT_FALSE(options.break_on_sentences);
    EXPECT_FALSE(options.preserve_breaks);
    EXPECT_FALSE(options.sentence_per_line);
    EXPECT_FALSE(options.semantic_line_breaks);
    EXPECT_TRUE(options.abbreviations.empty());
    EXPECT_EQ(options.length_mode, LengthMode::Chars);
    EXPECT_FALSE(options.splits_sentences());

    options.semantic_line_breaks = true;
    EXPECT_TRUE(options.splits_sentences());
}

TEST(ReflowOptionsTest, ParseLengthMode) {
    LengthMode mode = LengthMode::Chars;
    EXPECT_TRUE(parse_length_mode("visual", &mode));
    EXPECT_EQ(mode, LengthMode::Visual);
    EXPECT_TRUE(parse_length_mode("characters", &mode));
    EXPECT_EQ(mode, LengthMode::Chars);
    EXPECT_TRUE(parse_length_mode("visual-width", &mode));
    EXPECT_EQ(mode, LengthMode::Visual);
    EXPECT_TRUE(parse_length_mode("BYTES", &mode));
    EXPECT_EQ(mode, LengthMode::Bytes);
    EXPECT_TRUE(parse_length_mode("display", &mode));
    EXPECT_EQ(mode, LengthMode::Visual);
}

TEST(ReflowOptionsTest, UnknownNamesLeaveOutputUntouched) {
    LengthMode length = LengthMode::Bytes;
    EXPECT_FALSE(parse_length_mode("furlongs", &length));
    EXPECT_EQ(length, LengthMode::Bytes);
    EXPECT_FALSE(parse_length_mode(NULL, &length));

    ReflowMode mode = ReflowMode::Normalize;
    EXPECT_FALSE(parse_reflow_mode("paragraph", &mode));
    EXPECT_EQ(mode, ReflowMode::Normalize);
}

TEST(ReflowOptionsTest, ParseReflowMode) {
    ReflowMode mode = ReflowMode::Default;
    EXPECT_TRUE(parse_reflow_mode("sentence-per-line", &mode));
    EXPECT_EQ(mode, ReflowMode::SentencePerLine);
    EXPECT_TRUE(parse_reflow_mode("normalize", &mode));
    EXPECT_EQ(mode, ReflowMode::Normalize);
    EXPECT_TRUE(parse_reflow_mode("sentence_per_line", &mode));
    EXPECT_EQ(mode, ReflowMode::SentencePerLine);
    EXPECT_TRUE(parse_reflow_mode("default", &mode));
    EXPECT_EQ(mode, ReflowMode::Default);
}

TEST(ReflowOptionsTest, ModeNamesParseBack) {
    for (LengthMode mode : {LengthMode::Chars, LengthMode::Visual, LengthMode::Bytes}) {
        LengthMode parsed;
        ASSERT_TRUE(parse_length_mode(length_mode_name(mode), &parsed));
        EXPECT_EQ(parsed, mode);
    }
    for (ReflowMode mode : {ReflowMode::Default, ReflowMode::Normalize, ReflowMode::SentencePerLine}) {
        ReflowMode parsed;
        ASSERT_TRUE(parse_reflow_mode(reflow_mode_name(mode), &parsed));
        EXPECT_EQ(parsed, mode);
    }
}

TEST(ReflowOptionsTest, FromConfig) {
    ReflowConfig config = ReflowConfig::defaults();
    EXPECT_EQ(config.line_length, 80u);
    EXPECT_EQ(config.reflow_mode, ReflowMode::Default);

    config.line_length = 100;
    config.reflow = true;
    config.reflow_mode = ReflowMode::SentencePerLine;
    config.length_mode = LengthMode::Visual;
    config.abbreviations = {"Fig.", "", "etc"};

    ReflowOptions options = reflow_options_from_config(config);
    EXPECT_EQ(options.line_length, 100u);
    EXPECT_TRUE(options.sentence_per_line);
    EXPECT_FALSE(options.semantic_line_breaks);
    EXPECT_EQ(options.length_mode, LengthMode::Visual);
    ASSERT_EQ(options.abbreviations.size(), 2u);
    EXPECT_EQ(options.abbreviations[0], "Fig.");
    EXPECT_EQ(options.abbreviations[1], "etc");
}

TEST(ReflowOptionsTest, ModesMapLineBreakHandling) {
    ReflowConfig config = ReflowConfig::defaults();
    ReflowOptions options = reflow_options_from_config(config);
    EXPECT_TRUE(options.break_on_sentences);
    EXPECT_TRUE(options.preserve_breaks);
    EXPECT_FALSE(options.splits_sentences());

    config.reflow_mode = ReflowMode::Normalize;
    options = reflow_options_from_config(config);
    EXPECT_TRUE(options.break_on_sentences);
    EXPECT_FALSE(options.preserve_breaks);
    EXPECT_FALSE(options.splits_sentences());

    config.reflow_mode = ReflowMode::SentencePerLine;
    options = reflow_options_from_config(config);
    EXPECT_TRUE(options.break_on_sentences);
    EXPECT_TRUE(options.preserve_breaks);
}

TEST(ReflowOptionsTest, AutofixFlagIsLeftToCaller) {
    ReflowConfig config = ReflowConfig::defaults();
    config.line_length = 60;
    ReflowOptions off = reflow_options_from_config(config);
    config.reflow = true;
    ReflowOptions on = reflow_options_from_config(config);
    EXPECT_EQ(off.line_length, on.line_length);
    EXPECT_EQ(off.preserve_breaks, on.preserve_breaks);
    EXPECT_EQ(off.break_on_sentences, on.break_on_sentences);
    EXPECT_EQ(off.sentence_per_line, on.sentence_per_line);
}

TEST(ReflowOptionsTest, LogCategory) {
    log_category_t* cat = reflow_log();
    ASSERT_NE(cat, nullptr);
    EXPECT_STREQ(cat->name, "mdlint.reflow");
    EXPECT_EQ(reflow_log(), cat);
}

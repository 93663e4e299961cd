#include "navigator/word_scanner.h"
#include <gtest/gtest.h>

using namespace gutex;

TEST(WordScanner, AsciiSpaceClassification) {
    for (char c : std::string(" \t\n\v\f\r"))
        EXPECT_TRUE(isAsciiSpace(static_cast<unsigned char>(c)));
    EXPECT_FALSE(isAsciiSpace('a'));
    EXPECT_FALSE(isAsciiSpace(0xA0)); // NBSP byte is not ASCII space
}

TEST(WordScanner, Utf8SequenceLengths) {
    EXPECT_EQ(utf8SequenceLength('a'), 1u);
    EXPECT_EQ(utf8SequenceLength(0xC3), 2u);
    EXPECT_EQ(utf8SequenceLength(0xE2), 3u);
    EXPECT_EQ(utf8SequenceLength(0xF0), 4u);
    EXPECT_EQ(utf8SequenceLength(0x80), 1u);
    EXPECT_TRUE(isUtf8Continuation(0xA9));
    EXPECT_FALSE(isUtf8Continuation(0xC3));
}

TEST(WordScanner, SafeSpanKeepsCompleteText) {
    const std::string text = "caf\xC3\xA9 \xE2\x82\xAC";
    auto span = utf8SafeSpan(text);
    EXPECT_EQ(span.first, 0u);
    EXPECT_EQ(span.second, text.size());
}

TEST(WordScanner, SafeSpanTrimsCutSequences) {
    // Window starts inside "é" and ends inside "€".
    const std::string text = "\xA9 ok \xE2\x82";
    auto span = utf8SafeSpan(text);
    EXPECT_EQ(span.first, 1u);
    EXPECT_EQ(text.substr(span.first, span.second - span.first), " ok ");

    auto lone = utf8SafeSpan("ab\xC3");
    EXPECT_EQ(lone.second, 2u);

    auto empty = utf8SafeSpan("");
    EXPECT_EQ(empty.first, 0u);
    EXPECT_EQ(empty.second, 0u);
}

TEST(WordScanner, ScansWordsWithAbsoluteOffsets) {
    auto words = scanWords("alpha beta  gamma", 0, 0, 0, true, 10);
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0].start, 0);
    EXPECT_EQ(words[0].end, 4);
    EXPECT_EQ(words[1].start, 6);
    EXPECT_EQ(words[1].end, 9);
    EXPECT_EQ(words[2].start, 12);
    EXPECT_EQ(words[2].end, 16);
    for (const auto &w : words)
        EXPECT_TRUE(w.complete);
}

TEST(WordScanner, SkipsTailOfWordStartedBeforeScan) {
    auto words = scanWords("alpha beta gamma", 0, 2, 0, true, 10);
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0].start, 6);
    EXPECT_EQ(words[1].start, 11);
}

TEST(WordScanner, BufferOffsetAndDocumentStart) {
    // Byte 100 is mid-document: its predecessor is unknown so it cannot start a word.
    auto words = scanWords("xx yy", 100, 101, 0, true, 10);
    ASSERT_EQ(words.size(), 1u);
    EXPECT_EQ(words[0].start, 103);
    EXPECT_EQ(words[0].end, 104);

    auto fromStart = scanWords("xx yy", 100, 100, 100, true, 10);
    ASSERT_EQ(fromStart.size(), 2u);
    EXPECT_EQ(fromStart[0].start, 100);

    auto leading = scanWords("  hello", 0, 0, 0, true, 10);
    ASSERT_EQ(leading.size(), 1u);
    EXPECT_EQ(leading[0].start, 2);
}

TEST(WordScanner, WordCutByWindowIsIncomplete) {
    auto cut = scanWords("one two thr", 0, 0, 0, false, 10);
    ASSERT_EQ(cut.size(), 3u);
    EXPECT_TRUE(cut[1].complete);
    EXPECT_FALSE(cut[2].complete);

    auto atEnd = scanWords("one two thr", 0, 0, 0, true, 10);
    EXPECT_TRUE(atEnd[2].complete);

    auto trailingSpace = scanWords("one two ", 0, 0, 0, false, 10);
    EXPECT_TRUE(trailingSpace[1].complete);
}

TEST(WordScanner, StopsAtMaxWords) {
    auto words = scanWords("a b c d e", 0, 0, 0, true, 2);
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[1].start, 2);
    EXPECT_TRUE(scanWords("a b", 0, 0, 0, true, 0).empty());
}

TEST(WordScanner, DetectsParagraphBreaks) {
    auto words = scanWords("end.\n\nNext para\r\n\r\nThird\nline", 0, 0, 0, true, 10);
    ASSERT_EQ(words.size(), 5u);
    EXPECT_FALSE(words[0].paragraphBefore);
    EXPECT_TRUE(words[1].paragraphBefore);
    EXPECT_FALSE(words[2].paragraphBefore);
    EXPECT_TRUE(words[3].paragraphBefore);
    EXPECT_FALSE(words[4].paragraphBefore);
}

TEST(WordScanner, MultibyteWordsStayWhole) {
    const std::string text = "caf\xC3\xA9 na\xC3\xAFve";
    auto words = scanWords(text, 0, 0, 0, true, 10);
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0].end, 4);
    EXPECT_EQ(text.substr(words[1].start, words[1].end - words[1].start + 1),
              "na\xC3\xAFve");
}

TEST(WordScanner, CountWords) {
    EXPECT_EQ(countWords(""), 0u);
    EXPECT_EQ(countWords(" \n\t "), 0u);
    EXPECT_EQ(countWords("one two\nthree"), 3u);
    EXPECT_EQ(countWords("  lead and trail  "), 3u);
}

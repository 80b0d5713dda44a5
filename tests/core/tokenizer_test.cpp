// Tests for core/tokenizer.h -- note and interval name lexing.

#include "core/tokenizer.h"

#include <gtest/gtest.h>

namespace tonal {
namespace {

// ---------------------------------------------------------------------------
// tokenizeNote
// ---------------------------------------------------------------------------

TEST(TokenizeNoteTest, LetterAccidentalsOctave) {
  NoteTokens tokens = tokenizeNote("c#4");
  EXPECT_EQ(tokens.letter, "C");
  EXPECT_EQ(tokens.accidentals, "#");
  EXPECT_EQ(tokens.octave, "4");
  EXPECT_EQ(tokens.rest, "");
}

TEST(TokenizeNoteTest, DoubleSharpLetterExpands) {
  EXPECT_EQ(tokenizeNote("fx").accidentals, "##");
  EXPECT_EQ(tokenizeNote("Gxx5").accidentals, "####");
}

TEST(TokenizeNoteTest, FlatsAndNegativeOctave) {
  NoteTokens tokens = tokenizeNote("Bbb-1");
  EXPECT_EQ(tokens.letter, "B");
  EXPECT_EQ(tokens.accidentals, "bb");
  EXPECT_EQ(tokens.octave, "-1");
}

TEST(TokenizeNoteTest, SharpsAndFlatsMayMix) {
  NoteTokens tokens = tokenizeNote("Cb#");
  EXPECT_EQ(tokens.accidentals, "b#");
  EXPECT_EQ(tokens.rest, "");
}

TEST(TokenizeNoteTest, DoubleSharpRunDoesNotMix) {
  NoteTokens tokens = tokenizeNote("Cx#");
  EXPECT_EQ(tokens.accidentals, "##");
  EXPECT_EQ(tokens.rest, "#");
}

TEST(TokenizeNoteTest, LoneMinusIsLeftInRest) {
  NoteTokens tokens = tokenizeNote("C-");
  EXPECT_EQ(tokens.octave, "");
  EXPECT_EQ(tokens.rest, "-");
}

TEST(TokenizeNoteTest, TrailingTextAfterWhitespace) {
  NoteTokens tokens = tokenizeNote("C4 maj7");
  EXPECT_EQ(tokens.octave, "4");
  EXPECT_EQ(tokens.rest, "maj7");
}

TEST(TokenizeNoteTest, NonLetterHasEmptyLetter) {
  EXPECT_EQ(tokenizeNote("H4").letter, "");
  EXPECT_EQ(tokenizeNote("").letter, "");
  EXPECT_EQ(tokenizeNote("#4").letter, "");
}

// ---------------------------------------------------------------------------
// tokenizeInterval
// ---------------------------------------------------------------------------

TEST(TokenizeIntervalTest, TonalForm) {
  IntervalTokens tokens = tokenizeInterval("-3m");
  EXPECT_EQ(tokens.number, "-3");
  EXPECT_EQ(tokens.quality, "m");

  EXPECT_EQ(tokenizeInterval("+5P").number, "+5");
  EXPECT_EQ(tokenizeInterval("4AAAA").quality, "AAAA");
  EXPECT_EQ(tokenizeInterval("5dddd").quality, "dddd");
}

TEST(TokenizeIntervalTest, ShorthandFormIsReordered) {
  IntervalTokens tokens = tokenizeInterval("M3");
  EXPECT_EQ(tokens.number, "3");
  EXPECT_EQ(tokens.quality, "M");

  tokens = tokenizeInterval("m-2");
  EXPECT_EQ(tokens.number, "-2");
  EXPECT_EQ(tokens.quality, "m");

  EXPECT_EQ(tokenizeInterval("dd5").quality, "dd");
  EXPECT_EQ(tokenizeInterval("AA4").quality, "AA");
}

TEST(TokenizeIntervalTest, RejectsMalformedNames) {
  EXPECT_EQ(tokenizeInterval("").number, "");
  EXPECT_EQ(tokenizeInterval("P").number, "");
  EXPECT_EQ(tokenizeInterval("5").number, "");
  EXPECT_EQ(tokenizeInterval("5AAAAA").number, "");
  EXPECT_EQ(tokenizeInterval("AAA5").number, "");
  EXPECT_EQ(tokenizeInterval("5Pm").number, "");
  EXPECT_EQ(tokenizeInterval("P5x").number, "");
  EXPECT_EQ(tokenizeInterval("5mA").number, "");
}

}  // namespace
}  // namespace tonal

// Tests for core/notation.h -- pitch and interval grammar, anchoring and round-trips.

#include "core/notation.h"

#include <gtest/gtest.h>

#include <string>

#include "core/errors.h"
#include "test_helpers.h"

namespace pitchtypes {
namespace {

// ---------------------------------------------------------------------------
// parsePitch
// ---------------------------------------------------------------------------

TEST(ParsePitchTest, PitchWithOctave) {
  auto parsed = notation::parsePitch("C#4");
  ASSERT_TRUE(parsed.octave.has_value());
  EXPECT_EQ(*parsed.octave, 4);
  EXPECT_EQ(parsed.fifths, 7);
}

TEST(ParsePitchTest, PitchClassHasNoOctave) {
  auto parsed = notation::parsePitch("Eb");
  EXPECT_FALSE(parsed.octave.has_value());
  EXPECT_EQ(parsed.fifths, -3);
}

TEST(ParsePitchTest, NegativeOctave) {
  auto parsed = notation::parsePitch("Dbb-2");
  ASSERT_TRUE(parsed.octave.has_value());
  EXPECT_EQ(*parsed.octave, -2);
  EXPECT_EQ(parsed.fifths, -12);
}

TEST(ParsePitchTest, UnicodeAccidentals) {
  EXPECT_EQ(notation::parsePitch("E♭").fifths, -3);
  EXPECT_EQ(notation::parsePitch("F♯♯5").fifths, 13);
}

TEST(ParsePitchTest, RejectsMalformed) {
  EXPECT_THROW(notation::parsePitch(""), ParseError);
  EXPECT_THROW(notation::parsePitch("H4"), ParseError);
  EXPECT_THROW(notation::parsePitch("c4"), ParseError);
  EXPECT_THROW(notation::parsePitch("C##b4"), ParseError);
  EXPECT_THROW(notation::parsePitch("C#♯4"), ParseError);
  EXPECT_THROW(notation::parsePitch("C4x"), ParseError);
  EXPECT_THROW(notation::parsePitch("C-"), ParseError);
  EXPECT_THROW(notation::parsePitch("C99999999999"), ParseError);
}

TEST(ParsePitchTest, ErrorCarriesInputAndGrammar) {
  try {
    notation::parsePitch("H4");
    FAIL() << "expected ParseError";
  } catch (const ParseError& err) {
    EXPECT_EQ(err.input(), "H4");
    EXPECT_EQ(err.grammar(), notation::kPitchGrammar);
    EXPECT_NE(std::string(err.what()).find("'H4'"), std::string::npos);
  }
}

// ---------------------------------------------------------------------------
// parseInterval
// ---------------------------------------------------------------------------

TEST(ParseIntervalTest, IntervalWithOctave) {
  auto parsed = notation::parseInterval("M6:0");
  EXPECT_EQ(parsed.sign, 1);
  ASSERT_TRUE(parsed.octave.has_value());
  EXPECT_EQ(*parsed.octave, 0);
  EXPECT_EQ(parsed.fifths, 3);
}

TEST(ParseIntervalTest, SignAndClass) {
  auto parsed = notation::parseInterval("-m3");
  EXPECT_EQ(parsed.sign, -1);
  EXPECT_FALSE(parsed.octave.has_value());
  EXPECT_EQ(parsed.fifths, -3);
  EXPECT_EQ(notation::parseInterval("+P5").sign, 1);
}

TEST(ParseIntervalTest, EmptyQualityMeansMajor) {
  EXPECT_EQ(notation::parseInterval("3").fifths, notation::parseInterval("M3").fifths);
}

TEST(ParseIntervalTest, DiminishedImperfectTakesExtraStep) {
  EXPECT_EQ(notation::parseInterval("d5").fifths, -6);
  EXPECT_EQ(notation::parseInterval("d3").fifths, -10);
  EXPECT_EQ(notation::parseInterval("dd1").fifths, -14);
  EXPECT_EQ(notation::parseInterval("aa2:1").fifths, 16);
}

TEST(ParseIntervalTest, RejectsQualityGenericMismatch) {
  EXPECT_THROW(notation::parseInterval("P3"), ParseError);
  EXPECT_THROW(notation::parseInterval("M5"), ParseError);
  EXPECT_THROW(notation::parseInterval("m4:0"), ParseError);
  EXPECT_THROW(notation::parseInterval("4"), ParseError);
}

TEST(ParseIntervalTest, RejectsMalformed) {
  EXPECT_THROW(notation::parseInterval(""), ParseError);
  EXPECT_THROW(notation::parseInterval("M8"), ParseError);
  EXPECT_THROW(notation::parseInterval("M0"), ParseError);
  EXPECT_THROW(notation::parseInterval("ad3"), ParseError);
  EXPECT_THROW(notation::parseInterval("M3:"), ParseError);
  EXPECT_THROW(notation::parseInterval("M3:x"), ParseError);
  EXPECT_THROW(notation::parseInterval("M3 "), ParseError);
  EXPECT_THROW(notation::parseInterval("--M3"), ParseError);
}

// ---------------------------------------------------------------------------
// Round-trips
// ---------------------------------------------------------------------------

TEST(NotationRoundTripTest, EveryPitchClass) {
  test_helpers::forEachFifths([](int fifths, const char* pitch_name, const char*) {
    EXPECT_EQ(notation::parsePitch(pitch_name).fifths, fifths) << pitch_name;
    EXPECT_EQ(notation::formatPitch(fifths), pitch_name);
  });
}

TEST(NotationRoundTripTest, EveryPitchWithOctave) {
  test_helpers::forEachFifths([](int fifths, const char* pitch_name, const char*) {
    std::string with_octave = std::string(pitch_name) + "3";
    auto parsed = notation::parsePitch(with_octave);
    EXPECT_EQ(parsed.fifths, fifths);
    ASSERT_TRUE(parsed.octave.has_value());
    EXPECT_EQ(notation::formatPitch(parsed.fifths, parsed.octave), with_octave);
  });
}

TEST(NotationRoundTripTest, EveryIntervalClass) {
  test_helpers::forEachFifths([](int fifths, const char*, const char* interval_name) {
    EXPECT_EQ(notation::parseInterval(interval_name).fifths, fifths) << interval_name;
  });
}

TEST(LooksLikePitchTest, RoutesByFirstCharacter) {
  EXPECT_TRUE(notation::looksLikePitch("C4"));
  EXPECT_TRUE(notation::looksLikePitch("G"));
  EXPECT_FALSE(notation::looksLikePitch("M3"));
  EXPECT_FALSE(notation::looksLikePitch("-m3:0"));
  EXPECT_FALSE(notation::looksLikePitch(""));
}

}  // namespace
}  // namespace pitchtypes

// Tests for convert/converters.h -- the single-hop Spelled -> Enharmonic and
// Enharmonic -> LogFreq conversions.

#include "convert/converters.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "core/line_of_fifths.h"
#include "test_helpers.h"

namespace pitchtypes {
namespace {

constexpr double kTolerance = 1e-9;

// ---------------------------------------------------------------------------
// Spelled -> Enharmonic
// ---------------------------------------------------------------------------

TEST(SpelledToEnharmonicTest, ReferencePitches) {
  EXPECT_EQ(toEnharmonic(SpelledPitch("C4")).midi(), 60);
  EXPECT_EQ(toEnharmonic(SpelledPitch("A4")).midi(), 69);
  EXPECT_EQ(toEnharmonic(SpelledPitch("C#4")).midi(), 61);
  EXPECT_EQ(toEnharmonic(SpelledPitch("Db4")).midi(), 61);
  EXPECT_EQ(toEnharmonic(SpelledPitch("Cb4")).midi(), 59);
  EXPECT_EQ(toEnharmonic(SpelledPitch("B#3")).midi(), 60);
  EXPECT_EQ(toEnharmonic(SpelledPitch("C-1")).midi(), 0);
  EXPECT_EQ(toEnharmonic(SpelledPitch("G9")).midi(), 127);
}

TEST(SpelledToEnharmonicTest, EveryPitchAcrossOctaves) {
  for (int octave = -1; octave <= 9; octave += 5) {
    test_helpers::forEachFifths([octave](int, const char* pitch_name, const char*) {
      SpelledPitch pitch(std::string(pitch_name) + std::to_string(octave));
      int expected = 7 * pitch.fifths() + 12 * pitch.internalOctaves() + 12;
      EXPECT_EQ(toEnharmonic(pitch).midi(), expected) << pitch.name();
    });
  }
}

TEST(SpelledToEnharmonicTest, Intervals) {
  EXPECT_EQ(toEnharmonic(SpelledInterval("M3:0")).semitones(), 4);
  EXPECT_EQ(toEnharmonic(SpelledInterval("M6:0")).semitones(), 9);
  EXPECT_EQ(toEnharmonic(SpelledInterval("-m2:0")).semitones(), -1);
  EXPECT_EQ(toEnharmonic(SpelledInterval("-m3:0")).semitones(), -3);
  EXPECT_EQ(toEnharmonic(SpelledInterval("M2:1")).semitones(), 14);
  EXPECT_EQ(toEnharmonic(SpelledInterval("aa2:1")).semitones(), 16);
  EXPECT_EQ(toEnharmonic(SpelledInterval("d1:0")).semitones(), -1);
  EXPECT_EQ(toEnharmonic(SpelledInterval("-P1:1")).semitones(), -12);
}

TEST(SpelledToEnharmonicTest, EveryIntervalMatchesCoordinates) {
  test_helpers::forEachFifths([](int, const char*, const char* interval_name) {
    for (const char* octave : {":0", ":2"}) {
      SpelledInterval interval(std::string(interval_name) + octave);
      int expected = 7 * interval.fifths() + 12 * interval.internalOctaves();
      EXPECT_EQ(toEnharmonic(interval).semitones(), expected) << interval.name();
      EXPECT_EQ(toEnharmonic(-interval).semitones(), -expected) << interval.name();
    }
  });
}

TEST(SpelledToEnharmonicTest, PitchMinusPitchCommutesWithConversion) {
  SpelledPitch low("Gb3");
  SpelledPitch high("D#5");
  EXPECT_EQ(toEnharmonic(high - low), toEnharmonic(high) - toEnharmonic(low));
  EXPECT_EQ(toEnharmonic(low - high), toEnharmonic(low) - toEnharmonic(high));
}

TEST(SpelledToEnharmonicTest, Classes) {
  test_helpers::forEachFifths([](int fifths, const char* pitch_name, const char* interval_name) {
    int expected = lof::floorMod(7 * fifths, 12);
    EXPECT_EQ(toEnharmonic(SpelledPitchClass(pitch_name)).value(), expected) << pitch_name;
    EXPECT_EQ(toEnharmonic(SpelledIntervalClass(interval_name)).value(), expected)
        << interval_name;
  });
  EXPECT_EQ(toEnharmonic(SpelledPitchClass("Cb")).value(), 11);
  EXPECT_EQ(toEnharmonic(SpelledPitchClass("B#")).value(), 0);
  EXPECT_EQ(toEnharmonic(SpelledIntervalClass("-m3")).value(), 9);
}

// ---------------------------------------------------------------------------
// Enharmonic -> LogFreq
// ---------------------------------------------------------------------------

TEST(EnharmonicToLogFreqTest, Pitches) {
  EXPECT_NEAR(toLogFreq(EnharmonicPitch(69)).freq(), 440.0, kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicPitch(57)).freq(), 220.0, kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicPitch(60)).freq(), 261.6255653, 1e-6);
  EXPECT_EQ(toLogFreq(EnharmonicPitch(69)).name(), "440Hz");
}

TEST(EnharmonicToLogFreqTest, Intervals) {
  EXPECT_NEAR(toLogFreq(EnharmonicInterval(12)).ratio(), 2.0, kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicInterval(-12)).ratio(), 0.5, kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicInterval(7)).ratio(), std::pow(2.0, 7.0 / 12.0), kTolerance);
  EXPECT_EQ(toLogFreq(EnharmonicInterval(0)).direction(), 0);
}

TEST(EnharmonicToLogFreqTest, ClassesStayReduced) {
  EXPECT_NEAR(toLogFreq(EnharmonicPitchClass(9)).freq(), 1.71875, kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicPitchClass(9)).value(),
              toLogFreq(EnharmonicPitch(69)).pc().value(), kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicIntervalClass(7)).ratio(), std::pow(2.0, 7.0 / 12.0),
              kTolerance);
  EXPECT_NEAR(toLogFreq(EnharmonicIntervalClass(0)).value(), 0.0, kTolerance);
}

}  // namespace
}  // namespace pitchtypes

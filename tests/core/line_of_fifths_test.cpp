// Tests for core/line_of_fifths.h -- floor arithmetic, degrees, qualities and names.

#include "core/line_of_fifths.h"

#include <gtest/gtest.h>

#include <string>

#include "core/errors.h"
#include "test_helpers.h"

namespace pitchtypes {
namespace {

// ---------------------------------------------------------------------------
// floorDiv / floorMod
// ---------------------------------------------------------------------------

TEST(FloorArithmeticTest, PositiveOperands) {
  EXPECT_EQ(lof::floorDiv(7, 7), 1);
  EXPECT_EQ(lof::floorDiv(13, 7), 1);
  EXPECT_EQ(lof::floorMod(13, 7), 6);
  EXPECT_EQ(lof::floorMod(0, 7), 0);
}

TEST(FloorArithmeticTest, NegativeDividendRoundsDown) {
  EXPECT_EQ(lof::floorDiv(-1, 7), -1);
  EXPECT_EQ(lof::floorDiv(-7, 7), -1);
  EXPECT_EQ(lof::floorDiv(-8, 7), -2);
  EXPECT_EQ(lof::floorMod(-1, 7), 6);
  EXPECT_EQ(lof::floorMod(-7, 7), 0);
  EXPECT_EQ(lof::floorMod(-20, 12), 4);
}

TEST(FloorArithmeticTest, ModHasSignOfDivisor) {
  EXPECT_EQ(lof::floorMod(5, -3), -1);
  EXPECT_EQ(lof::floorDiv(5, -3), -2);
}

TEST(FloorArithmeticTest, DivModIdentity) {
  for (int num = -30; num <= 30; ++num) {
    EXPECT_EQ(lof::floorDiv(num, 7) * 7 + lof::floorMod(num, 7), num) << num;
  }
}

// ---------------------------------------------------------------------------
// Degrees and accidentals
// ---------------------------------------------------------------------------

TEST(DegreeTest, NaturalLetters) {
  EXPECT_EQ(lof::degree(0), 0);   // C
  EXPECT_EQ(lof::degree(2), 1);   // D
  EXPECT_EQ(lof::degree(4), 2);   // E
  EXPECT_EQ(lof::degree(-1), 3);  // F
  EXPECT_EQ(lof::degree(1), 4);   // G
  EXPECT_EQ(lof::degree(3), 5);   // A
  EXPECT_EQ(lof::degree(5), 6);   // B
}

TEST(DegreeTest, AccidentalsKeepDegree) {
  EXPECT_EQ(lof::degree(7), 0);    // C#
  EXPECT_EQ(lof::degree(-7), 0);   // Cb
  EXPECT_EQ(lof::degree(-12), 1);  // Dbb
}

TEST(DegreeTest, GenericIntervalNumber) {
  EXPECT_EQ(lof::genericIntervalNumber(0), 1);
  EXPECT_EQ(lof::genericIntervalNumber(1), 5);
  EXPECT_EQ(lof::genericIntervalNumber(-1), 4);
  EXPECT_EQ(lof::genericIntervalNumber(4), 3);
  EXPECT_EQ(lof::diatonicSteps(3), 12);
}

TEST(AccidentalsTest, SharpsAndFlats) {
  EXPECT_EQ(lof::accidentals(0), 0);
  EXPECT_EQ(lof::accidentals(5), 0);    // B
  EXPECT_EQ(lof::accidentals(-1), 0);   // F
  EXPECT_EQ(lof::accidentals(6), 1);    // F#
  EXPECT_EQ(lof::accidentals(-2), -1);  // Bb
  EXPECT_EQ(lof::accidentals(-14), -2);
  EXPECT_EQ(lof::accidentals(26), 3);
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

TEST(PitchClassNameTest, GoldenTable) {
  test_helpers::forEachFifths([](int fifths, const char* pitch_name, const char*) {
    EXPECT_EQ(lof::pitchClassName(fifths), pitch_name) << "fifths " << fifths;
  });
}

TEST(IntervalClassNameTest, GoldenTable) {
  test_helpers::forEachFifths([](int fifths, const char*, const char* interval_name) {
    EXPECT_EQ(lof::intervalClassName(fifths), interval_name) << "fifths " << fifths;
  });
}

TEST(IntervalClassNameTest, InverseNamesMirrorEntry) {
  EXPECT_EQ(lof::intervalClassName(4, true), "m6");
  EXPECT_EQ(lof::intervalClassName(-3, true), "M6");
  EXPECT_EQ(lof::intervalClassName(0, true), "P1");
  EXPECT_EQ(lof::intervalClassName(7, true), "d1");
}

TEST(IntervalQualityTest, Boundaries) {
  EXPECT_EQ(lof::intervalQuality(-5), "m");
  EXPECT_EQ(lof::intervalQuality(-2), "m");
  EXPECT_EQ(lof::intervalQuality(-1), "P");
  EXPECT_EQ(lof::intervalQuality(1), "P");
  EXPECT_EQ(lof::intervalQuality(2), "M");
  EXPECT_EQ(lof::intervalQuality(5), "M");
  EXPECT_EQ(lof::intervalQuality(6), "a");
  EXPECT_EQ(lof::intervalQuality(-6), "d");
  EXPECT_EQ(lof::intervalQuality(13), "aa");
  EXPECT_EQ(lof::intervalQuality(-13), "dd");
}

// ---------------------------------------------------------------------------
// Inverse lookups
// ---------------------------------------------------------------------------

TEST(FifthsFromLetterTest, AllLetters) {
  EXPECT_EQ(lof::fifthsFromLetter('F'), -1);
  EXPECT_EQ(lof::fifthsFromLetter('C'), 0);
  EXPECT_EQ(lof::fifthsFromLetter('G'), 1);
  EXPECT_EQ(lof::fifthsFromLetter('D'), 2);
  EXPECT_EQ(lof::fifthsFromLetter('A'), 3);
  EXPECT_EQ(lof::fifthsFromLetter('E'), 4);
  EXPECT_EQ(lof::fifthsFromLetter('B'), 5);
}

TEST(FifthsFromLetterTest, InvalidLetterThrows) {
  EXPECT_THROW(lof::fifthsFromLetter('H'), DomainError);
  EXPECT_THROW(lof::fifthsFromLetter('c'), DomainError);
}

TEST(FifthsFromGenericTest, PerfectAndMajorForms) {
  EXPECT_EQ(lof::fifthsFromGeneric(1), 0);   // P1
  EXPECT_EQ(lof::fifthsFromGeneric(2), 2);   // M2
  EXPECT_EQ(lof::fifthsFromGeneric(3), 4);   // M3
  EXPECT_EQ(lof::fifthsFromGeneric(4), -1);  // P4
  EXPECT_EQ(lof::fifthsFromGeneric(5), 1);   // P5
  EXPECT_EQ(lof::fifthsFromGeneric(6), 3);   // M6
  EXPECT_EQ(lof::fifthsFromGeneric(7), 5);   // M7
}

TEST(FifthsFromGenericTest, OutOfRangeThrows) {
  EXPECT_THROW(lof::fifthsFromGeneric(0), DomainError);
  EXPECT_THROW(lof::fifthsFromGeneric(8), DomainError);
}

}  // namespace
}  // namespace pitchtypes

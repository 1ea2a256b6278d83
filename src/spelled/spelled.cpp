/// @file
/// @brief Spelled pitch and interval arithmetic on (fifths, octave) coordinates.

#include "spelled/spelled.h"

#include <cstdlib>

#include "core/errors.h"
#include "core/line_of_fifths.h"
#include "core/notation.h"

namespace pitchtypes {

namespace {

/// Octaves implied by walking `fifths` fifths from C (4 steps per fifth).
int octavesFromFifths(int fifths) {
  return lof::floorDiv(lof::diatonicSteps(fifths), lof::kStepsPerOctave);
}

/// @brief Exact integer quotient for scaling a value down.
/// @throws DomainError on zero divisor or a non-zero remainder.
int exactQuotient(int value, int divisor, const char* what) {
  if (divisor == 0) {
    throw DomainError(std::string("cannot divide ") + what + " by zero");
  }
  if (value % divisor != 0) {
    throw DomainError(std::string(what) + " is not divisible by " + std::to_string(divisor));
  }
  return value / divisor;
}

}  // namespace

// ---------------------------------------------------------------------------
// SpelledInterval
// ---------------------------------------------------------------------------

SpelledInterval::SpelledInterval(const std::string& notation_str) {
  notation::IntervalNotation parsed = notation::parseInterval(notation_str);
  if (!parsed.octave) throw ParseError(notation_str, notation::kIntervalGrammar);
  fifths_ = parsed.fifths * parsed.sign;
  internal_octaves_ = (*parsed.octave - octavesFromFifths(parsed.fifths)) * parsed.sign;
}

SpelledInterval SpelledInterval::fromFifthsAndOctaves(int fifths, int internal_octaves) {
  return SpelledInterval(fifths, internal_octaves);
}

SpelledInterval SpelledInterval::fromFifthsAndIndependentOctave(int fifths, int octave) {
  return SpelledInterval(fifths, octave - octavesFromFifths(fifths));
}

int SpelledInterval::octaves() const {
  return internal_octaves_ + octavesFromFifths(fifths_);
}

int SpelledInterval::diatonicSteps() const {
  return lof::diatonicSteps(fifths_) + lof::kStepsPerOctave * internal_octaves_;
}

int SpelledInterval::degree() const { return lof::degree(fifths_); }

int SpelledInterval::generic() const {
  if (direction() < 0) return -(-*this).degree();
  return degree();
}

int SpelledInterval::alteration() const { return lof::accidentals(abs().fifths_); }

int SpelledInterval::direction() const { return lof::sign(diatonicSteps()); }

SpelledInterval SpelledInterval::abs() const {
  return direction() < 0 ? -*this : *this;
}

bool SpelledInterval::isStep() const { return std::abs(diatonicSteps()) <= 1; }

SpelledIntervalClass SpelledInterval::ic() const {
  return SpelledIntervalClass::fromFifths(fifths_);
}

SpelledIntervalClass SpelledInterval::toClass() const { return ic(); }

std::string SpelledInterval::name() const {
  int octave = std::abs(octaves());
  if (direction() == -1) {
    // Octave -1 is the first downward octave and prints as "-...:0";
    // unisons span no diatonic step and keep their count.
    if (lof::floorMod(diatonicSteps(), lof::kStepsPerOctave) != 0) --octave;
    return "-" + lof::intervalClassName(fifths_, true) + ":" + std::to_string(octave);
  }
  return lof::intervalClassName(fifths_) + ":" + std::to_string(octave);
}

int SpelledInterval::compare(const SpelledInterval& other) const {
  SpelledInterval diff = *this - other;
  int steps = lof::sign(diff.diatonicSteps());
  if (steps != 0) return steps;
  return lof::sign(diff.fifths_);
}

SpelledInterval SpelledInterval::operator+(const SpelledInterval& other) const {
  return SpelledInterval(fifths_ + other.fifths_, internal_octaves_ + other.internal_octaves_);
}

SpelledInterval SpelledInterval::operator-(const SpelledInterval& other) const {
  return SpelledInterval(fifths_ - other.fifths_, internal_octaves_ - other.internal_octaves_);
}

SpelledInterval SpelledInterval::operator-() const {
  return SpelledInterval(-fifths_, -internal_octaves_);
}

SpelledInterval SpelledInterval::operator*(int factor) const {
  return SpelledInterval(fifths_ * factor, internal_octaves_ * factor);
}

SpelledInterval SpelledInterval::operator/(int divisor) const {
  return SpelledInterval(exactQuotient(fifths_, divisor, "interval fifths"),
                         exactQuotient(internal_octaves_, divisor, "interval octaves"));
}

// ---------------------------------------------------------------------------
// SpelledPitch
// ---------------------------------------------------------------------------

SpelledPitch::SpelledPitch(const std::string& notation_str) {
  notation::PitchNotation parsed = notation::parsePitch(notation_str);
  if (!parsed.octave) throw ParseError(notation_str, notation::kPitchGrammar);
  fifths_ = parsed.fifths;
  internal_octaves_ = *parsed.octave - octavesFromFifths(parsed.fifths);
}

SpelledPitch SpelledPitch::fromFifthsAndOctaves(int fifths, int internal_octaves) {
  return SpelledPitch(fifths, internal_octaves);
}

SpelledPitch SpelledPitch::fromFifthsAndIndependentOctave(int fifths, int octave) {
  return SpelledPitch(fifths, octave - octavesFromFifths(fifths));
}

int SpelledPitch::octaves() const { return internal_octaves_ + octavesFromFifths(fifths_); }

int SpelledPitch::degree() const { return lof::degree(fifths_); }

int SpelledPitch::alteration() const { return lof::accidentals(fifths_); }

char SpelledPitch::letter() const {
  return static_cast<char>('A' + lof::floorMod(degree() + 2, lof::kStepsPerOctave));
}

SpelledPitchClass SpelledPitch::pc() const { return SpelledPitchClass::fromFifths(fifths_); }

SpelledPitchClass SpelledPitch::toClass() const { return pc(); }

SpelledInterval SpelledPitch::intervalFrom(const SpelledPitch& other) const {
  return *this - other;
}

SpelledInterval SpelledPitch::intervalTo(const SpelledPitch& other) const {
  return other - *this;
}

std::string SpelledPitch::name() const { return notation::formatPitch(fifths_, octaves()); }

int SpelledPitch::compare(const SpelledPitch& other) const {
  return (*this - other).compare(SpelledInterval::unison());
}

SpelledPitch SpelledPitch::operator+(const SpelledInterval& interval) const {
  return SpelledPitch(fifths_ + interval.fifths_, internal_octaves_ + interval.internal_octaves_);
}

SpelledPitch SpelledPitch::operator-(const SpelledInterval& interval) const {
  return SpelledPitch(fifths_ - interval.fifths_, internal_octaves_ - interval.internal_octaves_);
}

SpelledInterval SpelledPitch::operator-(const SpelledPitch& other) const {
  return SpelledInterval(fifths_ - other.fifths_, internal_octaves_ - other.internal_octaves_);
}

// ---------------------------------------------------------------------------
// SpelledIntervalClass
// ---------------------------------------------------------------------------

SpelledIntervalClass::SpelledIntervalClass(const std::string& notation_str) {
  notation::IntervalNotation parsed = notation::parseInterval(notation_str);
  if (parsed.octave) throw ParseError(notation_str, notation::kIntervalGrammar);
  fifths_ = parsed.fifths * parsed.sign;
}

int SpelledIntervalClass::degree() const { return lof::degree(fifths_); }

int SpelledIntervalClass::alteration() const { return lof::accidentals(fifths_); }

int SpelledIntervalClass::direction() const {
  int deg = degree();
  if (deg == 0) return lof::sign(alteration());
  return deg <= 3 ? 1 : -1;
}

SpelledIntervalClass SpelledIntervalClass::abs() const {
  return direction() < 0 ? -*this : *this;
}

bool SpelledIntervalClass::isStep() const {
  int deg = degree();
  return deg == 0 || deg == 1 || deg == 6;
}

SpelledInterval SpelledIntervalClass::embed() const {
  return SpelledInterval(fifths_, -octavesFromFifths(fifths_));
}

std::string SpelledIntervalClass::name(bool inverse) const {
  if (inverse) return "-" + lof::intervalClassName(fifths_, true);
  return lof::intervalClassName(fifths_);
}

int SpelledIntervalClass::compare(const SpelledIntervalClass& other) const {
  return lof::sign(fifths_ - other.fifths_);
}

SpelledIntervalClass SpelledIntervalClass::operator/(int divisor) const {
  return SpelledIntervalClass(exactQuotient(fifths_, divisor, "interval class fifths"));
}

// ---------------------------------------------------------------------------
// SpelledPitchClass
// ---------------------------------------------------------------------------

SpelledPitchClass::SpelledPitchClass(const std::string& notation_str) {
  notation::PitchNotation parsed = notation::parsePitch(notation_str);
  if (parsed.octave) throw ParseError(notation_str, notation::kPitchGrammar);
  fifths_ = parsed.fifths;
}

int SpelledPitchClass::degree() const { return lof::degree(fifths_); }

int SpelledPitchClass::alteration() const { return lof::accidentals(fifths_); }

char SpelledPitchClass::letter() const {
  return static_cast<char>('A' + lof::floorMod(degree() + 2, lof::kStepsPerOctave));
}

SpelledPitch SpelledPitchClass::embed() const {
  return SpelledPitch::fromFifthsAndOctaves(fifths_, -octavesFromFifths(fifths_));
}

std::string SpelledPitchClass::name() const { return notation::formatPitch(fifths_); }

int SpelledPitchClass::compare(const SpelledPitchClass& other) const {
  return lof::sign(fifths_ - other.fifths_);
}

}  // namespace pitchtypes

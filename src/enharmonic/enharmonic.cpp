/// @file
/// @brief Enharmonic semitone values, names and string construction.

#include "enharmonic/enharmonic.h"

#include <cmath>
#include <cstdlib>

#include "convert/converters.h"
#include "core/errors.h"
#include "core/line_of_fifths.h"
#include "spelled/spelled.h"

namespace pitchtypes {

namespace {

/// Pitch-class names 0-11 (C=0), sharp spelling.
constexpr const char* kSharpNoteNames[] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// Pitch-class names 0-11 (C=0), flat spelling.
constexpr const char* kFlatNoteNames[] = {
    "C", "Db", "D", "Eb", "E", "F", "Gb", "G", "Ab", "A", "Bb", "B"};

/// @brief Checked double -> int for fromNumber().
int integralValue(double value) {
  if (!std::isfinite(value) || std::floor(value) != value || value < -2147483648.0 ||
      value > 2147483647.0) {
    throw DomainError("expected an integral semitone value, got " + std::to_string(value));
  }
  return static_cast<int>(value);
}

int reduceToOctave(int semitones) { return lof::floorMod(semitones, kSemitonesPerOctave); }

int exactQuotient(int value, int divisor) {
  if (divisor == 0) throw DomainError("cannot divide semitones by zero");
  if (value % divisor != 0) {
    throw DomainError(std::to_string(value) + " semitones are not divisible by " +
                      std::to_string(divisor));
  }
  return value / divisor;
}

/// Signed interval name: "-" + magnitude for negative values.
std::string signedName(int value) {
  if (value < 0) return "-" + std::to_string(-static_cast<long long>(value));
  return std::to_string(value);
}

}  // namespace

double midiToFrequency(int midi) {
  return std::pow(2.0, (midi - kMidiA4) / 12.0) * kConcertPitchHz;
}

const char* enharmonicPitchClassName(int semitones, AccidentalStyle style) {
  int pitch_class = reduceToOctave(semitones);
  return style == AccidentalStyle::Flat ? kFlatNoteNames[pitch_class]
                                        : kSharpNoteNames[pitch_class];
}

// ---------------------------------------------------------------------------
// EnharmonicInterval
// ---------------------------------------------------------------------------

EnharmonicInterval::EnharmonicInterval(const std::string& notation)
    : value_(toEnharmonic(SpelledInterval(notation)).value()) {}

EnharmonicInterval EnharmonicInterval::fromNumber(double value) {
  return EnharmonicInterval(integralValue(value));
}

int EnharmonicInterval::octaves() const { return lof::floorDiv(value_, kSemitonesPerOctave); }

int EnharmonicInterval::direction() const { return lof::sign(value_); }

EnharmonicInterval EnharmonicInterval::abs() const { return EnharmonicInterval(std::abs(value_)); }

bool EnharmonicInterval::isStep() const { return std::abs(value_) <= 2; }

EnharmonicIntervalClass EnharmonicInterval::ic() const { return EnharmonicIntervalClass(value_); }

EnharmonicIntervalClass EnharmonicInterval::toClass() const { return ic(); }

std::string EnharmonicInterval::name() const { return signedName(value_); }

int EnharmonicInterval::compare(const EnharmonicInterval& other) const {
  return lof::sign(value_ - other.value_);
}

EnharmonicInterval EnharmonicInterval::operator/(int divisor) const {
  return EnharmonicInterval(exactQuotient(value_, divisor));
}

// ---------------------------------------------------------------------------
// EnharmonicPitch
// ---------------------------------------------------------------------------

EnharmonicPitch::EnharmonicPitch(const std::string& notation)
    : value_(toEnharmonic(SpelledPitch(notation)).value()) {}

EnharmonicPitch EnharmonicPitch::fromNumber(double value) {
  return EnharmonicPitch(integralValue(value));
}

int EnharmonicPitch::octaves() const { return lof::floorDiv(value_, kSemitonesPerOctave) - 1; }

EnharmonicPitchClass EnharmonicPitch::pc() const { return EnharmonicPitchClass(value_); }

EnharmonicPitchClass EnharmonicPitch::toClass() const { return pc(); }

std::string EnharmonicPitch::name(const PrintOptions& opts) const {
  if (opts.enharmonic_as_int) return std::to_string(value_);
  return std::string(enharmonicPitchClassName(value_, opts.accidentals)) +
         std::to_string(octaves());
}

int EnharmonicPitch::compare(const EnharmonicPitch& other) const {
  return lof::sign(value_ - other.value_);
}

// ---------------------------------------------------------------------------
// EnharmonicIntervalClass
// ---------------------------------------------------------------------------

EnharmonicIntervalClass::EnharmonicIntervalClass(int semitones)
    : value_(reduceToOctave(semitones)) {}

EnharmonicIntervalClass::EnharmonicIntervalClass(const std::string& notation)
    : value_(toEnharmonic(SpelledIntervalClass(notation)).value()) {}

EnharmonicIntervalClass EnharmonicIntervalClass::fromNumber(double value) {
  return EnharmonicIntervalClass(integralValue(value));
}

int EnharmonicIntervalClass::direction() const { return lof::sign(value_); }

std::string EnharmonicIntervalClass::name() const { return signedName(value_); }

int EnharmonicIntervalClass::compare(const EnharmonicIntervalClass& other) const {
  return lof::sign(value_ - other.value_);
}

EnharmonicIntervalClass EnharmonicIntervalClass::operator/(int divisor) const {
  return EnharmonicIntervalClass(exactQuotient(value_, divisor));
}

// ---------------------------------------------------------------------------
// EnharmonicPitchClass
// ---------------------------------------------------------------------------

EnharmonicPitchClass::EnharmonicPitchClass(int semitones) : value_(reduceToOctave(semitones)) {}

EnharmonicPitchClass::EnharmonicPitchClass(const std::string& notation)
    : value_(toEnharmonic(SpelledPitchClass(notation)).value()) {}

EnharmonicPitchClass EnharmonicPitchClass::fromNumber(double value) {
  return EnharmonicPitchClass(integralValue(value));
}

std::string EnharmonicPitchClass::name(const PrintOptions& opts) const {
  if (opts.enharmonic_as_int) return std::to_string(value_);
  return enharmonicPitchClassName(value_, opts.accidentals);
}

int EnharmonicPitchClass::compare(const EnharmonicPitchClass& other) const {
  return lof::sign(value_ - other.value_);
}

}  // namespace pitchtypes

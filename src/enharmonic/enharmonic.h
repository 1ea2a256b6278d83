// Enharmonic pitches and intervals -- 12-tone equal-tempered semitone counts
// in MIDI numbering (C4 = 60, A4 = 69).
//
// Class variants store value mod 12. Notation strings are parsed as spelled
// values and converted, so "C#4" and "Db4" both give MIDI 61.

#ifndef PITCHTYPES_ENHARMONIC_ENHARMONIC_H
#define PITCHTYPES_ENHARMONIC_ENHARMONIC_H

#include <string>

#include "core/print_options.h"
#include "core/value_kind.h"

namespace pitchtypes {

class EnharmonicPitchClass;
class EnharmonicIntervalClass;

/// Semitones in an octave.
constexpr int kSemitonesPerOctave = 12;

/// MIDI number of A4 (concert pitch reference).
constexpr int kMidiA4 = 69;

/// Concert pitch frequency of A4 in Hz.
constexpr double kConcertPitchHz = 440.0;

/// @brief Equal-tempered frequency of a MIDI pitch number (A4 = 440 Hz).
double midiToFrequency(int midi);

/// @brief Pitch-class name of a semitone value ("C#" or "Db" depending on style).
/// @param semitones Any integer; reduced mod 12.
const char* enharmonicPitchClassName(int semitones, AccidentalStyle style);

// ---------------------------------------------------------------------------
// EnharmonicInterval
// ---------------------------------------------------------------------------

/// @brief A signed number of semitones.
class EnharmonicInterval {
 public:
  static constexpr TypeId kTypeId{Family::Enharmonic, Kind::Interval};
  using Scalar = int;

  explicit EnharmonicInterval(int semitones) : value_(semitones) {}

  /// @brief Parse spelled interval notation ("M3:0") and convert it.
  explicit EnharmonicInterval(const std::string& notation);

  /// @throws DomainError if value is not an integer.
  static EnharmonicInterval fromNumber(double value);

  static EnharmonicInterval unison() { return EnharmonicInterval(0); }
  static EnharmonicInterval octave() { return EnharmonicInterval(kSemitonesPerOctave); }
  static EnharmonicInterval chromaticSemitone() { return EnharmonicInterval(1); }

  int value() const { return value_; }
  int semitones() const { return value_; }

  /// @brief Full octaves spanned, rounded down (-1 semitone -> -1).
  int octaves() const;

  int direction() const;
  EnharmonicInterval abs() const;

  /// @brief True for up to two semitones in either direction.
  bool isStep() const;

  EnharmonicIntervalClass ic() const;
  EnharmonicIntervalClass toClass() const;
  EnharmonicInterval embed() const { return *this; }

  /// @brief e.g. "7", "-3".
  std::string name() const;

  int compare(const EnharmonicInterval& other) const;

  template <typename To>
  To convertTo() const;

  EnharmonicInterval operator+(const EnharmonicInterval& other) const {
    return EnharmonicInterval(value_ + other.value_);
  }
  EnharmonicInterval operator-(const EnharmonicInterval& other) const {
    return EnharmonicInterval(value_ - other.value_);
  }
  EnharmonicInterval operator-() const { return EnharmonicInterval(-value_); }
  EnharmonicInterval operator*(int factor) const { return EnharmonicInterval(value_ * factor); }
  /// @throws DomainError unless the division is exact.
  EnharmonicInterval operator/(int divisor) const;

  bool operator==(const EnharmonicInterval& other) const { return value_ == other.value_; }
  bool operator!=(const EnharmonicInterval& other) const { return value_ != other.value_; }
  bool operator<(const EnharmonicInterval& other) const { return value_ < other.value_; }
  bool operator<=(const EnharmonicInterval& other) const { return value_ <= other.value_; }
  bool operator>(const EnharmonicInterval& other) const { return value_ > other.value_; }
  bool operator>=(const EnharmonicInterval& other) const { return value_ >= other.value_; }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return false; }

 private:
  int value_;
};

inline EnharmonicInterval operator*(int factor, const EnharmonicInterval& interval) {
  return interval * factor;
}

// ---------------------------------------------------------------------------
// EnharmonicPitch
// ---------------------------------------------------------------------------

/// @brief A MIDI pitch number (may lie outside 0..127).
class EnharmonicPitch {
 public:
  static constexpr TypeId kTypeId{Family::Enharmonic, Kind::Pitch};

  explicit EnharmonicPitch(int midi) : value_(midi) {}

  /// @brief Parse spelled pitch notation ("C#4") and convert it.
  explicit EnharmonicPitch(const std::string& notation);

  /// @throws DomainError if value is not an integer.
  static EnharmonicPitch fromNumber(double value);

  int value() const { return value_; }
  int midi() const { return value_; }

  /// @brief Octave in scientific pitch notation (60 -> 4).
  int octaves() const;

  /// @brief Equal-tempered frequency in Hz (A4 = 440).
  double freq() const { return midiToFrequency(value_); }

  EnharmonicPitchClass pc() const;
  EnharmonicPitchClass toClass() const;
  EnharmonicPitch embed() const { return *this; }

  EnharmonicInterval intervalFrom(const EnharmonicPitch& other) const { return *this - other; }
  EnharmonicInterval intervalTo(const EnharmonicPitch& other) const { return other - *this; }

  /// @brief e.g. "C#4", "Db4" (flat style) or "61" (enharmonic_as_int).
  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const EnharmonicPitch& other) const;

  template <typename To>
  To convertTo() const;

  EnharmonicPitch operator+(const EnharmonicInterval& interval) const {
    return EnharmonicPitch(value_ + interval.value());
  }
  EnharmonicPitch operator-(const EnharmonicInterval& interval) const {
    return EnharmonicPitch(value_ - interval.value());
  }
  EnharmonicInterval operator-(const EnharmonicPitch& other) const {
    return EnharmonicInterval(value_ - other.value_);
  }

  bool operator==(const EnharmonicPitch& other) const { return value_ == other.value_; }
  bool operator!=(const EnharmonicPitch& other) const { return value_ != other.value_; }
  bool operator<(const EnharmonicPitch& other) const { return value_ < other.value_; }
  bool operator<=(const EnharmonicPitch& other) const { return value_ <= other.value_; }
  bool operator>(const EnharmonicPitch& other) const { return value_ > other.value_; }
  bool operator>=(const EnharmonicPitch& other) const { return value_ >= other.value_; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return false; }

 private:
  int value_;
};

// ---------------------------------------------------------------------------
// EnharmonicIntervalClass
// ---------------------------------------------------------------------------

/// @brief Semitones modulo the octave, in [0, 12).
class EnharmonicIntervalClass {
 public:
  static constexpr TypeId kTypeId{Family::Enharmonic, Kind::IntervalClass};
  using Scalar = int;

  /// @param semitones Any integer; reduced mod 12.
  explicit EnharmonicIntervalClass(int semitones);

  /// @brief Parse spelled interval-class notation ("M3", "-m3") and convert it.
  explicit EnharmonicIntervalClass(const std::string& notation);

  /// @throws DomainError if value is not an integer.
  static EnharmonicIntervalClass fromNumber(double value);

  static EnharmonicIntervalClass unison() { return EnharmonicIntervalClass(0); }
  static EnharmonicIntervalClass octave() { return EnharmonicIntervalClass(0); }
  static EnharmonicIntervalClass chromaticSemitone() { return EnharmonicIntervalClass(1); }

  int value() const { return value_; }
  int semitones() const { return value_; }

  /// @brief 0 for the unison class, 1 otherwise.
  int direction() const;
  EnharmonicIntervalClass abs() const { return *this; }

  EnharmonicIntervalClass ic() const { return *this; }
  EnharmonicIntervalClass toClass() const { return *this; }

  /// @brief The interval of this class within the first octave.
  EnharmonicInterval embed() const { return EnharmonicInterval(value_); }

  std::string name() const;

  int compare(const EnharmonicIntervalClass& other) const;

  template <typename To>
  To convertTo() const;

  EnharmonicIntervalClass operator+(const EnharmonicIntervalClass& other) const {
    return EnharmonicIntervalClass(value_ + other.value_);
  }
  EnharmonicIntervalClass operator-(const EnharmonicIntervalClass& other) const {
    return EnharmonicIntervalClass(value_ - other.value_);
  }
  EnharmonicIntervalClass operator-() const { return EnharmonicIntervalClass(-value_); }
  EnharmonicIntervalClass operator*(int factor) const {
    return EnharmonicIntervalClass(value_ * factor);
  }
  /// @throws DomainError unless the stored value divides exactly.
  EnharmonicIntervalClass operator/(int divisor) const;

  bool operator==(const EnharmonicIntervalClass& other) const { return value_ == other.value_; }
  bool operator!=(const EnharmonicIntervalClass& other) const { return value_ != other.value_; }
  bool operator<(const EnharmonicIntervalClass& other) const { return value_ < other.value_; }
  bool operator<=(const EnharmonicIntervalClass& other) const { return value_ <= other.value_; }
  bool operator>(const EnharmonicIntervalClass& other) const { return value_ > other.value_; }
  bool operator>=(const EnharmonicIntervalClass& other) const { return value_ >= other.value_; }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return true; }

 private:
  int value_;
};

inline EnharmonicIntervalClass operator*(int factor, const EnharmonicIntervalClass& ic) {
  return ic * factor;
}

// ---------------------------------------------------------------------------
// EnharmonicPitchClass
// ---------------------------------------------------------------------------

/// @brief A pitch class in [0, 12), C = 0.
class EnharmonicPitchClass {
 public:
  static constexpr TypeId kTypeId{Family::Enharmonic, Kind::PitchClass};

  /// @param semitones Any integer; reduced mod 12.
  explicit EnharmonicPitchClass(int semitones);

  /// @brief Parse spelled pitch-class notation ("C#") and convert it.
  explicit EnharmonicPitchClass(const std::string& notation);

  /// @throws DomainError if value is not an integer.
  static EnharmonicPitchClass fromNumber(double value);

  int value() const { return value_; }

  EnharmonicPitchClass pc() const { return *this; }
  EnharmonicPitchClass toClass() const { return *this; }

  /// @brief The pitch of this class in octave 0 (C0 = 12).
  EnharmonicPitch embed() const { return EnharmonicPitch(value_ + kSemitonesPerOctave); }

  EnharmonicIntervalClass intervalFrom(const EnharmonicPitchClass& other) const {
    return *this - other;
  }
  EnharmonicIntervalClass intervalTo(const EnharmonicPitchClass& other) const {
    return other - *this;
  }

  /// @brief e.g. "C#", "Db" (flat style) or "1" (enharmonic_as_int).
  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const EnharmonicPitchClass& other) const;

  template <typename To>
  To convertTo() const;

  EnharmonicPitchClass operator+(const EnharmonicIntervalClass& ic) const {
    return EnharmonicPitchClass(value_ + ic.value());
  }
  EnharmonicPitchClass operator-(const EnharmonicIntervalClass& ic) const {
    return EnharmonicPitchClass(value_ - ic.value());
  }
  EnharmonicIntervalClass operator-(const EnharmonicPitchClass& other) const {
    return EnharmonicIntervalClass(value_ - other.value_);
  }

  bool operator==(const EnharmonicPitchClass& other) const { return value_ == other.value_; }
  bool operator!=(const EnharmonicPitchClass& other) const { return value_ != other.value_; }
  bool operator<(const EnharmonicPitchClass& other) const { return value_ < other.value_; }
  bool operator<=(const EnharmonicPitchClass& other) const { return value_ <= other.value_; }
  bool operator>(const EnharmonicPitchClass& other) const { return value_ > other.value_; }
  bool operator>=(const EnharmonicPitchClass& other) const { return value_ >= other.value_; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return true; }

 private:
  int value_;
};

}  // namespace pitchtypes

#endif  // PITCHTYPES_ENHARMONIC_ENHARMONIC_H

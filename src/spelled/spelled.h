// Spelled pitches and intervals -- values on the line of fifths with octave
// bookkeeping, e.g. C#4, Eb, M6:0, -m3.
//
// Non-class values store (fifths, internal octave), where the internal octave
// is the octave of the C-based realization: the written octave is
// internal_octave + floor(4 * fifths / 7). Class values store fifths only.

#ifndef PITCHTYPES_SPELLED_SPELLED_H
#define PITCHTYPES_SPELLED_SPELLED_H

#include <string>

#include "core/value_kind.h"

namespace pitchtypes {

class SpelledPitch;
class SpelledInterval;
class SpelledPitchClass;
class SpelledIntervalClass;

// ---------------------------------------------------------------------------
// SpelledInterval
// ---------------------------------------------------------------------------

/// @brief A spelled interval with octave, e.g. "M6:0", "-m3:0", "aa2:1".
class SpelledInterval {
 public:
  static constexpr TypeId kTypeId{Family::Spelled, Kind::Interval};
  using Scalar = int;

  /// @brief Parse interval notation "<[+-]?><quality><generic>:<octave>".
  /// @throws ParseError if the string is malformed or lacks the ":octave" part.
  explicit SpelledInterval(const std::string& notation);

  /// @brief Create from internal coordinates (fifths, C-based octaves).
  static SpelledInterval fromFifthsAndOctaves(int fifths, int internal_octaves);

  /// @brief Create from fifths and the written (independent) octave count.
  static SpelledInterval fromFifthsAndIndependentOctave(int fifths, int octave);

  /// @brief Perfect unison (P1:0).
  static SpelledInterval unison() { return SpelledInterval(0, 0); }
  /// @brief Perfect octave (P1:1).
  static SpelledInterval octave() { return SpelledInterval(0, 1); }
  /// @brief Chromatic semitone (a1:0).
  static SpelledInterval chromaticSemitone() { return SpelledInterval(7, -4); }

  int fifths() const { return fifths_; }
  int internalOctaves() const { return internal_octaves_; }

  /// @brief Written octave count (negative intervals start at -1).
  int octaves() const;

  /// @brief Diatonic steps including direction and octaves (octave = 7).
  int diatonicSteps() const;

  /// @brief Relative scale degree (0-6) the interval points to.
  int degree() const;

  /// @brief Degree of the absolute interval, negated for downward intervals.
  int generic() const;

  /// @brief Semitones of deviation from the perfect/major form of abs().
  int alteration() const;

  /// @brief 1 up, -1 down, 0 for all unisons (sign of diatonicSteps()).
  int direction() const;

  /// @brief The upward counterpart of a downward interval.
  SpelledInterval abs() const;

  /// @brief True for unisons and seconds in either direction.
  bool isStep() const;

  SpelledIntervalClass ic() const;
  SpelledIntervalClass toClass() const;
  SpelledInterval embed() const { return *this; }

  /// @brief Canonical notation, e.g. "M3:0", "-P5:1", "d1:0".
  std::string name() const;

  /// @brief Diatonic ordering: -1, 0 or 1. Same-size alterations rank by sharpness.
  int compare(const SpelledInterval& other) const;

  template <typename To>
  To convertTo() const;

  SpelledInterval operator+(const SpelledInterval& other) const;
  SpelledInterval operator-(const SpelledInterval& other) const;
  SpelledInterval operator-() const;
  SpelledInterval operator*(int factor) const;
  /// @throws DomainError unless both coordinates divide exactly.
  SpelledInterval operator/(int divisor) const;

  bool operator==(const SpelledInterval& other) const {
    return fifths_ == other.fifths_ && internal_octaves_ == other.internal_octaves_;
  }
  bool operator!=(const SpelledInterval& other) const { return !(*this == other); }
  bool operator<(const SpelledInterval& other) const { return compare(other) < 0; }
  bool operator<=(const SpelledInterval& other) const { return compare(other) <= 0; }
  bool operator>(const SpelledInterval& other) const { return compare(other) > 0; }
  bool operator>=(const SpelledInterval& other) const { return compare(other) >= 0; }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return false; }

 private:
  SpelledInterval(int fifths, int internal_octaves)
      : fifths_(fifths), internal_octaves_(internal_octaves) {}

  int fifths_;
  int internal_octaves_;

  friend class SpelledPitch;
  friend class SpelledIntervalClass;
};

inline SpelledInterval operator*(int factor, const SpelledInterval& interval) {
  return interval * factor;
}

// ---------------------------------------------------------------------------
// SpelledPitch
// ---------------------------------------------------------------------------

/// @brief A spelled pitch with octave, e.g. "C#4", "Dbb5", "E♭-1".
class SpelledPitch {
 public:
  static constexpr TypeId kTypeId{Family::Spelled, Kind::Pitch};

  /// @brief Parse pitch notation "<letter><accidentals><octave>".
  /// @throws ParseError if the string is malformed or has no octave.
  explicit SpelledPitch(const std::string& notation);

  /// @brief Create from internal coordinates (fifths, C-based octaves).
  static SpelledPitch fromFifthsAndOctaves(int fifths, int internal_octaves);

  /// @brief Create from fifths and the written octave (C#4 -> (7, 4)).
  static SpelledPitch fromFifthsAndIndependentOctave(int fifths, int octave);

  int fifths() const { return fifths_; }
  int internalOctaves() const { return internal_octaves_; }

  /// @brief Written octave, e.g. 4 for C#4 and for Cb4.
  int octaves() const;

  /// @brief Letter index: C=0, D=1, ..., B=6.
  int degree() const;

  /// @brief Accidentals: sharps > 0, flats < 0, natural 0.
  int alteration() const;

  /// @brief Natural letter 'A'..'G'.
  char letter() const;

  SpelledPitchClass pc() const;
  SpelledPitchClass toClass() const;
  SpelledPitch embed() const { return *this; }

  /// @brief Interval from other up to this pitch (this - other).
  SpelledInterval intervalFrom(const SpelledPitch& other) const;

  /// @brief Interval from this pitch to other (other - this).
  SpelledInterval intervalTo(const SpelledPitch& other) const;

  /// @brief Canonical notation, e.g. "C#4".
  std::string name() const;

  /// @brief Diatonic ordering: -1, 0 or 1 (C#4 > C4 > Cb4 > B3).
  int compare(const SpelledPitch& other) const;

  template <typename To>
  To convertTo() const;

  SpelledPitch operator+(const SpelledInterval& interval) const;
  SpelledPitch operator-(const SpelledInterval& interval) const;
  SpelledInterval operator-(const SpelledPitch& other) const;

  bool operator==(const SpelledPitch& other) const {
    return fifths_ == other.fifths_ && internal_octaves_ == other.internal_octaves_;
  }
  bool operator!=(const SpelledPitch& other) const { return !(*this == other); }
  bool operator<(const SpelledPitch& other) const { return compare(other) < 0; }
  bool operator<=(const SpelledPitch& other) const { return compare(other) <= 0; }
  bool operator>(const SpelledPitch& other) const { return compare(other) > 0; }
  bool operator>=(const SpelledPitch& other) const { return compare(other) >= 0; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return false; }

 private:
  SpelledPitch(int fifths, int internal_octaves)
      : fifths_(fifths), internal_octaves_(internal_octaves) {}

  int fifths_;
  int internal_octaves_;
};

// ---------------------------------------------------------------------------
// SpelledIntervalClass
// ---------------------------------------------------------------------------

/// @brief A spelled interval class (no octave), e.g. "M6", "-m3", "aa2".
///
/// "-m3" denotes the inverse of m3, i.e. the same class as M6.
class SpelledIntervalClass {
 public:
  static constexpr TypeId kTypeId{Family::Spelled, Kind::IntervalClass};
  using Scalar = int;

  /// @brief Parse interval-class notation "<[+-]?><quality><generic>".
  /// @throws ParseError if the string is malformed or carries an octave.
  explicit SpelledIntervalClass(const std::string& notation);

  static SpelledIntervalClass fromFifths(int fifths) { return SpelledIntervalClass(fifths); }

  /// @brief Perfect unison (P1).
  static SpelledIntervalClass unison() { return SpelledIntervalClass(0); }
  /// @brief Same as unison() for classes.
  static SpelledIntervalClass octave() { return SpelledIntervalClass(0); }
  /// @brief Augmented unison (a1).
  static SpelledIntervalClass chromaticSemitone() { return SpelledIntervalClass(7); }

  int fifths() const { return fifths_; }
  int octaves() const { return 0; }
  int internalOctaves() const { return 0; }

  /// @brief Scale degree (0-6) the class points to upwards.
  int degree() const;
  int diatonicSteps() const { return degree(); }
  int generic() const { return degree(); }

  /// @brief Deviation from the perfect/major form of the class as named.
  int alteration() const;

  /// @brief Shortest-path direction.
  ///
  /// Degrees 1-3 point up, 4-6 down. Unisons follow the alteration sign
  /// (P1 neutral, a1 up, d1 down).
  int direction() const;

  SpelledIntervalClass abs() const;

  /// @brief True for unison, second and seventh classes.
  bool isStep() const;

  SpelledIntervalClass ic() const { return *this; }
  SpelledIntervalClass toClass() const { return *this; }

  /// @brief The interval of this class in octave 0 (e.g. m7 -> m7:0).
  SpelledInterval embed() const;

  /// @brief Canonical notation, e.g. "M3"; with inverse, "-m6" for the same class.
  std::string name(bool inverse = false) const;

  /// @brief Ordering by raw fifths (-1, 0 or 1).
  int compare(const SpelledIntervalClass& other) const;

  template <typename To>
  To convertTo() const;

  SpelledIntervalClass operator+(const SpelledIntervalClass& other) const {
    return SpelledIntervalClass(fifths_ + other.fifths_);
  }
  SpelledIntervalClass operator-(const SpelledIntervalClass& other) const {
    return SpelledIntervalClass(fifths_ - other.fifths_);
  }
  SpelledIntervalClass operator-() const { return SpelledIntervalClass(-fifths_); }
  SpelledIntervalClass operator*(int factor) const {
    return SpelledIntervalClass(fifths_ * factor);
  }
  /// @throws DomainError unless the fifths divide exactly.
  SpelledIntervalClass operator/(int divisor) const;

  bool operator==(const SpelledIntervalClass& other) const { return fifths_ == other.fifths_; }
  bool operator!=(const SpelledIntervalClass& other) const { return fifths_ != other.fifths_; }
  bool operator<(const SpelledIntervalClass& other) const { return fifths_ < other.fifths_; }
  bool operator<=(const SpelledIntervalClass& other) const { return fifths_ <= other.fifths_; }
  bool operator>(const SpelledIntervalClass& other) const { return fifths_ > other.fifths_; }
  bool operator>=(const SpelledIntervalClass& other) const { return fifths_ >= other.fifths_; }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return true; }

 private:
  explicit SpelledIntervalClass(int fifths) : fifths_(fifths) {}

  int fifths_;
};

inline SpelledIntervalClass operator*(int factor, const SpelledIntervalClass& ic) {
  return ic * factor;
}

// ---------------------------------------------------------------------------
// SpelledPitchClass
// ---------------------------------------------------------------------------

/// @brief A spelled pitch class (no octave), e.g. "C#", "Eb", "F##".
class SpelledPitchClass {
 public:
  static constexpr TypeId kTypeId{Family::Spelled, Kind::PitchClass};

  /// @brief Parse pitch-class notation "<letter><accidentals>".
  /// @throws ParseError if the string is malformed or carries an octave.
  explicit SpelledPitchClass(const std::string& notation);

  /// @brief Create from a line-of-fifths position (C=0, G=1, F=-1, ...).
  static SpelledPitchClass fromFifths(int fifths) { return SpelledPitchClass(fifths); }

  int fifths() const { return fifths_; }
  int octaves() const { return 0; }
  int internalOctaves() const { return 0; }

  /// @brief Letter index: C=0, D=1, ..., B=6.
  int degree() const;

  /// @brief Accidentals: sharps > 0, flats < 0, natural 0.
  int alteration() const;

  /// @brief Natural letter 'A'..'G'.
  char letter() const;

  SpelledPitchClass pc() const { return *this; }
  SpelledPitchClass toClass() const { return *this; }

  /// @brief The pitch of this class in (written) octave 0.
  SpelledPitch embed() const;

  /// @brief Interval class from other up to this pitch class.
  SpelledIntervalClass intervalFrom(const SpelledPitchClass& other) const {
    return *this - other;
  }

  /// @brief Interval class from this pitch class to other.
  SpelledIntervalClass intervalTo(const SpelledPitchClass& other) const {
    return other - *this;
  }

  /// @brief Canonical notation, e.g. "C#".
  std::string name() const;

  /// @brief Ordering by raw fifths (-1, 0 or 1).
  int compare(const SpelledPitchClass& other) const;

  template <typename To>
  To convertTo() const;

  SpelledPitchClass operator+(const SpelledIntervalClass& ic) const {
    return SpelledPitchClass(fifths_ + ic.fifths());
  }
  SpelledPitchClass operator-(const SpelledIntervalClass& ic) const {
    return SpelledPitchClass(fifths_ - ic.fifths());
  }
  SpelledIntervalClass operator-(const SpelledPitchClass& other) const {
    return SpelledIntervalClass::fromFifths(fifths_ - other.fifths_);
  }

  bool operator==(const SpelledPitchClass& other) const { return fifths_ == other.fifths_; }
  bool operator!=(const SpelledPitchClass& other) const { return fifths_ != other.fifths_; }
  bool operator<(const SpelledPitchClass& other) const { return fifths_ < other.fifths_; }
  bool operator<=(const SpelledPitchClass& other) const { return fifths_ <= other.fifths_; }
  bool operator>(const SpelledPitchClass& other) const { return fifths_ > other.fifths_; }
  bool operator>=(const SpelledPitchClass& other) const { return fifths_ >= other.fifths_; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return true; }

 private:
  explicit SpelledPitchClass(int fifths) : fifths_(fifths) {}

  int fifths_;
};

}  // namespace pitchtypes

#endif  // PITCHTYPES_SPELLED_SPELLED_H

// Line-of-fifths arithmetic -- diatonic steps, generic intervals, qualities
// and pitch-class names derived from a signed fifths coordinate.

#ifndef PITCHTYPES_CORE_LINE_OF_FIFTHS_H
#define PITCHTYPES_CORE_LINE_OF_FIFTHS_H

#include <string>

namespace pitchtypes {
namespace lof {

// ---------------------------------------------------------------------------
// Floor-semantics integer arithmetic
// ---------------------------------------------------------------------------

/// @brief Integer division rounding towards negative infinity.
/// @param num Dividend (any sign).
/// @param den Divisor (non-zero).
/// @return floor(num / den).
///
/// Examples: floorDiv(7, 7) = 1, floorDiv(-1, 7) = -1, floorDiv(-7, 7) = -1.
inline int floorDiv(int num, int den) {
  int quot = num / den;
  int rem = num % den;
  if (rem != 0 && ((rem < 0) != (den < 0))) --quot;
  return quot;
}

/// @brief Remainder matching floorDiv (result has the sign of the divisor).
/// @param num Dividend (any sign).
/// @param den Divisor (non-zero).
/// @return num - den * floorDiv(num, den); in [0, den) for positive den.
inline int floorMod(int num, int den) {
  int rem = num % den;
  if (rem != 0 && ((rem < 0) != (den < 0))) rem += den;
  return rem;
}

/// @brief Sign of an integer.
/// @return -1, 0 or 1.
inline int sign(int value) { return (value > 0) - (value < 0); }

// ---------------------------------------------------------------------------
// Fifths -> diatonic properties
// ---------------------------------------------------------------------------

/// Number of steps in a diatonic octave.
constexpr int kStepsPerOctave = 7;

/// Fifths added by one sharp (or removed by one flat).
constexpr int kFifthsPerAccidental = 7;

/// @brief Diatonic steps spanned by a number of fifths (4 per fifth).
inline int diatonicSteps(int fifths) { return 4 * fifths; }

/// @brief Relative scale degree (0-6) reached from C / unison.
/// @param fifths Position on the line of fifths.
/// @return 0 for C / unison, 1 for D / 2nd, ..., 6 for B / 7th.
inline int degree(int fifths) { return floorMod(diatonicSteps(fifths), kStepsPerOctave); }

/// @brief Generic interval number (1-7) of a fifths position.
inline int genericIntervalNumber(int fifths) { return degree(fifths) + 1; }

/// @brief Number of accidentals (sharps > 0, flats < 0) of a fifths position.
///
/// For intervals this is the alteration relative to the perfect/major form.
inline int accidentals(int fifths) { return floorDiv(fifths + 1, kFifthsPerAccidental); }

/// @brief Spelled pitch-class name of a fifths position.
/// @param fifths Position on the line of fifths (C = 0).
/// @return Letter plus accidentals, e.g. "C", "F#", "Bbb", "E###".
std::string pitchClassName(int fifths);

/// @brief Interval quality of a fifths position.
/// @param fifths Position on the line of fifths (P1 = 0).
/// @return "P", "M", "m", or a run of 'a' / 'd' (e.g. "aa", "ddd").
///
/// [-5, 5] maps to minor/perfect/major; beyond that each further 7 fifths
/// adds one augmentation (positive side) or diminution (negative side).
std::string intervalQuality(int fifths);

/// @brief Interval-class name (quality + generic number).
/// @param fifths Position on the line of fifths.
/// @param inverse If true, name the inverse class (-fifths) instead.
/// @return e.g. "M3", "P5", "aa4", "ddd2".
std::string intervalClassName(int fifths, bool inverse = false);

// ---------------------------------------------------------------------------
// Letters / generic numbers -> fifths
// ---------------------------------------------------------------------------

/// @brief Fifths position of a natural pitch class.
/// @param letter One of 'A'..'G' (case-sensitive).
/// @return -1 (F) .. 5 (B).
/// @throws DomainError for any other character.
int fifthsFromLetter(char letter);

/// @brief Fifths position of the perfect/major form of a generic interval.
/// @param generic Generic interval number in 1..7.
/// @return (2 * generic - 1) mod 7 - 1, i.e. -1 .. 5.
/// @throws DomainError if generic is outside 1..7.
int fifthsFromGeneric(int generic);

/// @brief Whether a generic interval number (1-7) is a perfect interval (1, 4, 5).
inline bool isPerfectGeneric(int generic) {
  return generic == 1 || generic == 4 || generic == 5;
}

}  // namespace lof
}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_LINE_OF_FIFTHS_H

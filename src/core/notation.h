// Notation grammar -- parsing and printing of pitch ("C#4", "Eb") and
// interval ("-m3:0", "aa2") strings to and from fifths/octave coordinates.

#ifndef PITCHTYPES_CORE_NOTATION_H
#define PITCHTYPES_CORE_NOTATION_H

#include <optional>
#include <string>

namespace pitchtypes {
namespace notation {

/// Grammar description reported by ParseError for pitch strings.
extern const char* const kPitchGrammar;

/// Grammar description reported by ParseError for interval strings.
extern const char* const kIntervalGrammar;

/// @brief Parsed pitch or pitch-class notation.
struct PitchNotation {
  std::optional<int> octave;  ///< Written octave; empty for a pitch class.
  int fifths = 0;             ///< Position on the line of fifths.
};

/// @brief Parsed interval or interval-class notation.
struct IntervalNotation {
  int sign = 1;               ///< -1 if written with a leading '-', else +1.
  std::optional<int> octave;  ///< Written octave count; empty for a class.
  int fifths = 0;             ///< Fifths of the unsigned quality+generic part.
};

/// @brief Parse "<A-G><accidentals><octave?>".
///
/// Accidentals are all '#', all '♯', all 'b' or all '♭'. The octave is an
/// optional '-' followed by digits. The match is anchored at both ends.
///
/// @param str Notation string, e.g. "C#4", "Dbb5", "E♭", "B-1".
/// @return Octave (if written) and fifths.
/// @throws ParseError on any deviation from the grammar.
PitchNotation parsePitch(const std::string& str);

/// @brief Parse "<[+-]?><quality><generic><(:octave)?>".
///
/// Qualities: P (with 1, 4, 5), M / m / empty (with 2, 3, 6, 7), or a run of
/// 'a' or 'd' (with any generic). A diminished imperfect interval lies one
/// extra step of 7 fifths below its perfect counterpart for the same count.
///
/// @param str Notation string, e.g. "M6:0", "-m3", "aa2:1", "d5".
/// @return Sign, octave (if written) and fifths.
/// @throws ParseError on any deviation from the grammar.
IntervalNotation parseInterval(const std::string& str);

/// @brief Whether a string looks like pitch notation (starts with A-G).
///
/// Used to route untyped notation; does not validate the rest of the string.
bool looksLikePitch(const std::string& str);

/// @brief Print pitch notation (canonical spelling).
/// @param fifths Position on the line of fifths.
/// @param octave Written octave, or empty for a pitch class.
/// @return e.g. "C#4" or "C#".
std::string formatPitch(int fifths, std::optional<int> octave = std::nullopt);

}  // namespace notation
}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_NOTATION_H

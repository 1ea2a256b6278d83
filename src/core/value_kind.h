// Value kind tags -- representation family and pitch/interval/class kind of
// every value type, used for conversion lookup and dynamic dispatch.

#ifndef PITCHTYPES_CORE_VALUE_KIND_H
#define PITCHTYPES_CORE_VALUE_KIND_H

#include <cstdint>
#include <string>

namespace pitchtypes {

/// @brief Representation family of a value.
enum class Family : uint8_t {
  Spelled,     ///< Line of fifths + octave.
  Enharmonic,  ///< 12-tone equal-tempered semitones (MIDI numbering).
  LogFreq      ///< Natural log of frequency / frequency ratio.
};

/// @brief Position of a value in the pitch/interval x class/non-class square.
enum class Kind : uint8_t {
  Pitch,
  Interval,
  PitchClass,
  IntervalClass
};

/// @brief Identifies one concrete value type (e.g. Spelled + PitchClass).
struct TypeId {
  Family family = Family::Spelled;
  Kind kind = Kind::Pitch;

  constexpr bool operator==(const TypeId& other) const {
    return family == other.family && kind == other.kind;
  }
  constexpr bool operator!=(const TypeId& other) const { return !(*this == other); }
  constexpr bool operator<(const TypeId& other) const {
    if (family != other.family) return family < other.family;
    return kind < other.kind;
  }
};

/// @brief True for Pitch and PitchClass.
constexpr bool isPitchKind(Kind kind) { return kind == Kind::Pitch || kind == Kind::PitchClass; }

/// @brief True for PitchClass and IntervalClass.
constexpr bool isClassKind(Kind kind) {
  return kind == Kind::PitchClass || kind == Kind::IntervalClass;
}

/// @brief True if both kinds sit in the same cell of the pitch/interval x
/// class/non-class square.
constexpr bool sameKind(Kind a, Kind b) {
  return isPitchKind(a) == isPitchKind(b) && isClassKind(a) == isClassKind(b);
}

/// @brief Convert Family to a display string ("Spelled", "Enharmonic", "LogFreq").
const char* familyToString(Family family);

/// @brief Convert Kind to a display string ("Pitch", "Interval", ...).
const char* kindToString(Kind kind);

/// @brief Full type name, e.g. "SpelledPitchClass".
std::string typeName(TypeId type);

}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_VALUE_KIND_H

// Print options -- presentation settings for value names, loadable from a
// flat JSON object (no external dependencies).

#ifndef PITCHTYPES_CORE_PRINT_OPTIONS_H
#define PITCHTYPES_CORE_PRINT_OPTIONS_H

#include <cstdint>
#include <string>

namespace pitchtypes {

/// @brief Spelling used for black keys in enharmonic names.
enum class AccidentalStyle : uint8_t {
  Sharp,  ///< C#, D#, F#, G#, A#
  Flat    ///< Db, Eb, Gb, Ab, Bb
};

/// @brief Presentation settings. Never affect stored values or equality.
struct PrintOptions {
  /// Print enharmonic pitches and pitch classes as plain integers.
  bool enharmonic_as_int = false;
  /// Sharp or flat base names for enharmonic pitches.
  AccidentalStyle accidentals = AccidentalStyle::Sharp;
  /// Decimal places for log-frequency names (frequency / ratio).
  int logfreq_precision = 2;
};

/// Largest accepted logfreq_precision (digits of a double).
constexpr int kMaxLogFreqPrecision = 17;

/// @brief Convert AccidentalStyle to its config string ("sharp" / "flat").
const char* accidentalStyleToString(AccidentalStyle style);

/// @brief Parse an accidental style from its config string.
/// @param str "sharp" or "flat".
/// @return Parsed style.
/// @throws DomainError for any other value.
AccidentalStyle accidentalStyleFromString(const std::string& str);

/// @brief Load print options from a flat JSON object.
///
/// Recognised keys (all optional, defaults applied):
/// @code
///   {"enharmonic_as_int": false, "accidentals": "flat", "logfreq_precision": 3}
/// @endcode
/// Unknown keys are ignored with a warning on stderr. Nested objects and
/// arrays are skipped.
///
/// @param json JSON text.
/// @return PrintOptions with recognised keys applied.
/// @throws ParseError if the text is not a JSON object.
/// @throws DomainError if a recognised key has a value of the wrong type or range.
PrintOptions printOptionsFromJson(const std::string& json);

}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_PRINT_OPTIONS_H

// Tagged pitch/interval value -- a std::variant over all twelve value types
// with run-time checked algebra, for code that only learns the kind of a
// value from its notation or configuration.

#ifndef PITCHTYPES_CONVERT_ANY_VALUE_H
#define PITCHTYPES_CONVERT_ANY_VALUE_H

#include <string>
#include <variant>

#include "core/print_options.h"
#include "core/value_kind.h"
#include "enharmonic/enharmonic.h"
#include "logfreq/logfreq.h"
#include "spelled/spelled.h"

namespace pitchtypes {

/// @brief Any pitch or interval value of any family.
using AnyValue =
    std::variant<SpelledPitch, SpelledInterval, SpelledPitchClass, SpelledIntervalClass,
                 EnharmonicPitch, EnharmonicInterval, EnharmonicPitchClass,
                 EnharmonicIntervalClass, LogFreqPitch, LogFreqInterval, LogFreqPitchClass,
                 LogFreqIntervalClass>;

/// @brief Family and kind of the held value.
TypeId typeOf(const AnyValue& value);

/// @brief Name of the held value; options apply to Enharmonic and LogFreq.
std::string name(const AnyValue& value, const PrintOptions& opts = PrintOptions());

// ---------------------------------------------------------------------------
// Checked algebra
// ---------------------------------------------------------------------------
// Each function throws TypeMismatchError (naming both operand types and the
// operator) when the static types would not compile the same expression.

AnyValue add(const AnyValue& lhs, const AnyValue& rhs);
AnyValue subtract(const AnyValue& lhs, const AnyValue& rhs);
AnyValue negate(const AnyValue& value);

/// @brief Scale an interval by a factor.
/// @throws TypeMismatchError for pitches.
/// @throws DomainError if the family is integral and factor is not an integer.
AnyValue scale(const AnyValue& value, double factor);

/// @brief Divide an interval by a divisor.
/// @throws TypeMismatchError for pitches.
/// @throws DomainError for a zero divisor, a non-integer divisor of an
///         integral family, or an inexact integral division.
AnyValue divide(const AnyValue& value, double divisor);

AnyValue toClass(const AnyValue& value);
AnyValue embed(const AnyValue& value);

/// @brief Direction of an interval value (-1, 0 or 1).
/// @throws TypeMismatchError for pitches.
int direction(const AnyValue& value);

/// @brief Ordering of two values of the same type (-1, 0 or 1).
/// @throws TypeMismatchError if the types differ.
int compare(const AnyValue& lhs, const AnyValue& rhs);

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

/// @brief Parse spelled notation into whichever of the four types it denotes.
///
/// "C#4" -> SpelledPitch, "C#" -> SpelledPitchClass, "M3:0" ->
/// SpelledInterval, "M3" -> SpelledIntervalClass.
/// @throws ParseError if the string is neither pitch nor interval notation.
AnyValue parseSpelled(const std::string& str);

/// @brief Parse notation for a given family.
///
/// Spelled and Enharmonic read spelled notation (Enharmonic converts it).
/// LogFreq reads "<number>Hz" as a pitch and a plain number as an interval
/// ratio.
/// @throws ParseError if the string does not match the family's notation.
AnyValue parseValue(const std::string& str, Family family);

}  // namespace pitchtypes

#endif  // PITCHTYPES_CONVERT_ANY_VALUE_H

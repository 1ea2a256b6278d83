// convertTo entry point -- conversion between representation families through
// a ConverterRegistry, plus the definitions of the value types' member
// convertTo<To>() (include this header wherever those are called).

#ifndef PITCHTYPES_CONVERT_CONVERT_H
#define PITCHTYPES_CONVERT_CONVERT_H

#include <variant>

#include "convert/any_value.h"
#include "convert/converter_registry.h"

namespace pitchtypes {

/// @brief Convert a value to another family of the same kind.
///
/// @code
///   EnharmonicPitch midi = convertTo<EnharmonicPitch>(SpelledPitch("C#4"));  // 61
/// @endcode
///
/// @param value Source value.
/// @param registry Registry to look the pipeline up in (default graph if omitted).
/// @return The converted value; the value itself when From == To.
/// @throws ConversionNotFoundError if no pipeline is registered.
/// @throws ConversionConsistencyError if a converter returns a wrong type.
template <typename To, typename From>
To convertTo(const From& value,
             const ConverterRegistry& registry = ConverterRegistry::instance()) {
  return std::get<To>(registry.convert(AnyValue(value), To::kTypeId));
}

// ---------------------------------------------------------------------------
// Member convertTo<To>() definitions
// ---------------------------------------------------------------------------

template <typename To>
To SpelledPitch::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To SpelledInterval::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To SpelledPitchClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To SpelledIntervalClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To EnharmonicPitch::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To EnharmonicInterval::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To EnharmonicPitchClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To EnharmonicIntervalClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To LogFreqPitch::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To LogFreqInterval::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To LogFreqPitchClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

template <typename To>
To LogFreqIntervalClass::convertTo() const {
  return ::pitchtypes::convertTo<To>(*this);
}

}  // namespace pitchtypes

#endif  // PITCHTYPES_CONVERT_CONVERT_H

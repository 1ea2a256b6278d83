/// @file
/// @brief Run-time dispatch of the pitch/interval algebra over AnyValue.

#include "convert/any_value.h"

#include <cmath>
#include <type_traits>
#include <utility>

#include "convert/converters.h"
#include "core/algebra.h"
#include "core/errors.h"
#include "core/notation.h"

namespace pitchtypes {

namespace {

/// Whether T::name accepts PrintOptions (Enharmonic and LogFreq types).
template <typename T, typename = void>
struct NameTakesOptions : std::false_type {};
template <typename T>
struct NameTakesOptions<
    T, std::void_t<decltype(std::declval<const T&>().name(std::declval<const PrintOptions&>()))>>
    : std::true_type {};

template <typename T>
std::string typeNameOf() {
  return typeName(T::kTypeId);
}

/// @brief Checked double -> int for integral scalars.
int integralScalar(double value, const char* op) {
  if (!std::isfinite(value) || std::floor(value) != value || value < -2147483648.0 ||
      value > 2147483647.0) {
    throw DomainError(std::string("operation '") + op +
                      "' needs an integer scalar for this family, got " + std::to_string(value));
  }
  return static_cast<int>(value);
}

template <typename T>
AnyValue scaleValue(const T& value, double factor) {
  if constexpr (algebra::IsScalable<T>::value) {
    if constexpr (std::is_integral<typename T::Scalar>::value) {
      return AnyValue(value * integralScalar(factor, "*"));
    } else {
      return AnyValue(value * factor);
    }
  } else {
    throw TypeMismatchError("*", typeNameOf<T>(), "scalar");
  }
}

template <typename T>
AnyValue divideValue(const T& value, double divisor) {
  if constexpr (algebra::IsScalable<T>::value) {
    if constexpr (std::is_integral<typename T::Scalar>::value) {
      return AnyValue(value / integralScalar(divisor, "/"));
    } else {
      return AnyValue(value / divisor);
    }
  } else {
    throw TypeMismatchError("/", typeNameOf<T>(), "scalar");
  }
}

}  // namespace

TypeId typeOf(const AnyValue& value) {
  return std::visit([](const auto& val) { return std::decay_t<decltype(val)>::kTypeId; }, value);
}

std::string name(const AnyValue& value, const PrintOptions& opts) {
  return std::visit(
      [&opts](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;
        if constexpr (NameTakesOptions<T>::value) {
          return val.name(opts);
        } else {
          return val.name();
        }
      },
      value);
}

AnyValue add(const AnyValue& lhs, const AnyValue& rhs) {
  return std::visit(
      [](const auto& left, const auto& right) -> AnyValue {
        using L = std::decay_t<decltype(left)>;
        using R = std::decay_t<decltype(right)>;
        if constexpr (algebra::CanAdd<L, R>::value) {
          return AnyValue(left + right);
        } else {
          throw TypeMismatchError("+", typeNameOf<L>(), typeNameOf<R>());
        }
      },
      lhs, rhs);
}

AnyValue subtract(const AnyValue& lhs, const AnyValue& rhs) {
  return std::visit(
      [](const auto& left, const auto& right) -> AnyValue {
        using L = std::decay_t<decltype(left)>;
        using R = std::decay_t<decltype(right)>;
        if constexpr (algebra::CanSubtract<L, R>::value) {
          return AnyValue(left - right);
        } else {
          throw TypeMismatchError("-", typeNameOf<L>(), typeNameOf<R>());
        }
      },
      lhs, rhs);
}

AnyValue negate(const AnyValue& value) {
  return std::visit(
      [](const auto& val) -> AnyValue {
        using T = std::decay_t<decltype(val)>;
        if constexpr (algebra::HasNegation<T>::value) {
          return AnyValue(-val);
        } else {
          throw TypeMismatchError("operation 'negate' is undefined for " + typeNameOf<T>());
        }
      },
      value);
}

AnyValue scale(const AnyValue& value, double factor) {
  return std::visit([factor](const auto& val) { return scaleValue(val, factor); }, value);
}

AnyValue divide(const AnyValue& value, double divisor) {
  return std::visit([divisor](const auto& val) { return divideValue(val, divisor); }, value);
}

AnyValue toClass(const AnyValue& value) {
  return std::visit([](const auto& val) { return AnyValue(val.toClass()); }, value);
}

AnyValue embed(const AnyValue& value) {
  return std::visit([](const auto& val) { return AnyValue(val.embed()); }, value);
}

int direction(const AnyValue& value) {
  return std::visit(
      [](const auto& val) -> int {
        using T = std::decay_t<decltype(val)>;
        if constexpr (algebra::HasIntervalInterface<T>::value) {
          return val.direction();
        } else {
          throw TypeMismatchError("operation 'direction' is undefined for " + typeNameOf<T>());
        }
      },
      value);
}

int compare(const AnyValue& lhs, const AnyValue& rhs) {
  return std::visit(
      [](const auto& left, const auto& right) -> int {
        using L = std::decay_t<decltype(left)>;
        using R = std::decay_t<decltype(right)>;
        if constexpr (std::is_same<L, R>::value) {
          return left.compare(right);
        } else {
          throw TypeMismatchError("compare", typeNameOf<L>(), typeNameOf<R>());
        }
      },
      lhs, rhs);
}

AnyValue parseSpelled(const std::string& str) {
  if (notation::looksLikePitch(str)) {
    if (notation::parsePitch(str).octave) return AnyValue(SpelledPitch(str));
    return AnyValue(SpelledPitchClass(str));
  }
  if (notation::parseInterval(str).octave) return AnyValue(SpelledInterval(str));
  return AnyValue(SpelledIntervalClass(str));
}

AnyValue parseValue(const std::string& str, Family family) {
  switch (family) {
    case Family::Spelled:
      return parseSpelled(str);
    case Family::Enharmonic:
      return std::visit(
          [](const auto& val) -> AnyValue {
            using T = std::decay_t<decltype(val)>;
            if constexpr (T::kTypeId.family == Family::Spelled) {
              return AnyValue(toEnharmonic(val));
            } else {
              throw TypeMismatchError("parseSpelled returned " + typeNameOf<T>());
            }
          },
          parseSpelled(str));
    case Family::LogFreq:
      if (str.size() > 2 && str.compare(str.size() - 2, 2, "Hz") == 0) {
        return AnyValue(LogFreqPitch(str));
      }
      return AnyValue(LogFreqInterval(str));
  }
  throw DomainError("unknown value family");
}

}  // namespace pitchtypes

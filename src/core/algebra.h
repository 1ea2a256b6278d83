// Generic algebra contract shared by every representation family.
//
// Each family provides four concrete types (Pitch, Interval, PitchClass,
// IntervalClass). This header detects the required operations at compile
// time and implements family-independent helpers once, on top of them.

#ifndef PITCHTYPES_CORE_ALGEBRA_H
#define PITCHTYPES_CORE_ALGEBRA_H

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

namespace pitchtypes {
namespace algebra {

// ---------------------------------------------------------------------------
// Operation detection
// ---------------------------------------------------------------------------

template <typename A, typename B, typename = void>
struct CanAdd : std::false_type {};
template <typename A, typename B>
struct CanAdd<A, B, std::void_t<decltype(std::declval<const A&>() + std::declval<const B&>())>>
    : std::true_type {};

template <typename A, typename B, typename = void>
struct CanSubtract : std::false_type {};
template <typename A, typename B>
struct CanSubtract<A, B,
                   std::void_t<decltype(std::declval<const A&>() - std::declval<const B&>())>>
    : std::true_type {};

/// Scalable types name their scalar (int for exact families, double for LogFreq).
template <typename T, typename = void>
struct IsScalable : std::false_type {};
template <typename T>
struct IsScalable<T, std::void_t<typename T::Scalar,
                                 decltype(std::declval<const T&>() *
                                          std::declval<typename T::Scalar>()),
                                 decltype(std::declval<const T&>() /
                                          std::declval<typename T::Scalar>())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasNegation : std::false_type {};
template <typename T>
struct HasNegation<T, std::void_t<decltype(-std::declval<const T&>())>> : std::true_type {};

template <typename T, typename = void>
struct HasClassReduction : std::false_type {};
template <typename T>
struct HasClassReduction<T, std::void_t<decltype(std::declval<const T&>().toClass()),
                                        decltype(std::declval<const T&>().embed())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasIntervalInterface : std::false_type {};
template <typename T>
struct HasIntervalInterface<T, std::void_t<decltype(T::unison()), decltype(T::octave()),
                                           decltype(std::declval<const T&>().direction()),
                                           decltype(std::declval<const T&>().abs()),
                                           decltype(std::declval<const T&>().ic())>>
    : std::true_type {};

template <typename T, typename = void>
struct HasPitchInterface : std::false_type {};
template <typename T>
struct HasPitchInterface<T, std::void_t<decltype(std::declval<const T&>().pc())>>
    : std::true_type {};

// ---------------------------------------------------------------------------
// Contract
// ---------------------------------------------------------------------------

/// @brief Interval (or interval class) contract: a group under +, scalable.
template <typename I>
constexpr bool kIntervalContract =
    HasIntervalInterface<I>::value && HasClassReduction<I>::value &&
    CanAdd<I, I>::value && CanSubtract<I, I>::value && HasNegation<I>::value &&
    IsScalable<I>::value && !HasPitchInterface<I>::value;

/// @brief Pitch (or pitch class) contract relative to its interval type.
///
/// pitch - pitch -> interval, pitch +/- interval -> pitch, and neither
/// pitch + pitch nor scaling is defined.
template <typename P, typename I>
constexpr bool kPitchContract =
    HasPitchInterface<P>::value && HasClassReduction<P>::value &&
    std::is_same<decltype(std::declval<const P&>() - std::declval<const P&>()), I>::value &&
    std::is_same<decltype(std::declval<const P&>() + std::declval<const I&>()), P>::value &&
    std::is_same<decltype(std::declval<const P&>() - std::declval<const I&>()), P>::value &&
    !CanAdd<P, P>::value && !IsScalable<P>::value && !HasNegation<P>::value;

/// @brief Whether two value types may be combined by + or - at all.
template <typename A, typename B>
constexpr bool kCombinable = CanAdd<A, B>::value || CanSubtract<A, B>::value;

// ---------------------------------------------------------------------------
// Family-independent helpers
// ---------------------------------------------------------------------------

/// @brief Whether an interval equals the unison of its type.
template <typename I>
bool isUnison(const I& interval) {
  return interval == I::unison();
}

/// @brief Sum of a sequence of intervals (unison for an empty sequence).
template <typename I>
I sumIntervals(const std::vector<I>& intervals) {
  I total = I::unison();
  for (const auto& interval : intervals) total = total + interval;
  return total;
}

/// @brief Intervals between successive pitches of a melody.
/// @param pitches Pitch sequence (pitches or pitch classes of one family).
/// @return pitches[i+1] - pitches[i] for each adjacent pair.
template <typename P>
auto melodicIntervals(const std::vector<P>& pitches)
    -> std::vector<decltype(std::declval<const P&>() - std::declval<const P&>())> {
  std::vector<decltype(std::declval<const P&>() - std::declval<const P&>())> result;
  if (pitches.size() < 2) return result;
  result.reserve(pitches.size() - 1);
  for (size_t idx = 1; idx < pitches.size(); ++idx) {
    result.push_back(pitches[idx] - pitches[idx - 1]);
  }
  return result;
}

/// @brief Transpose every pitch of a sequence by the same interval.
template <typename P, typename I>
std::vector<P> transposeAll(const std::vector<P>& pitches, const I& interval) {
  std::vector<P> result;
  result.reserve(pitches.size());
  for (const auto& pitch : pitches) result.push_back(pitch + interval);
  return result;
}

}  // namespace algebra
}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_ALGEBRA_H

// Log-frequency pitches and intervals -- continuous values stored as the
// natural log of a frequency in Hz (pitches) or of a frequency ratio
// (intervals).
//
// Class variants are reduced into [0, log 2), i.e. octave equivalence.

#ifndef PITCHTYPES_LOGFREQ_LOGFREQ_H
#define PITCHTYPES_LOGFREQ_LOGFREQ_H

#include <string>

#include "core/print_options.h"
#include "core/value_kind.h"

namespace pitchtypes {

class LogFreqPitchClass;
class LogFreqIntervalClass;

/// @brief Format a positive number with at most `precision` decimals.
///
/// Trailing zeros and a trailing decimal point are removed ("440", "261.63").
std::string formatDecimal(double value, int precision);

// ---------------------------------------------------------------------------
// LogFreqInterval
// ---------------------------------------------------------------------------

/// @brief A frequency ratio stored as its natural log.
class LogFreqInterval {
 public:
  static constexpr TypeId kTypeId{Family::LogFreq, Kind::Interval};
  using Scalar = double;

  /// @brief Parse a plain ratio, e.g. "1.5".
  /// @throws ParseError if the string is not a number.
  /// @throws DomainError if the ratio is not positive.
  explicit LogFreqInterval(const std::string& ratio);

  static LogFreqInterval fromLog(double log_ratio) { return LogFreqInterval(log_ratio); }
  /// @throws DomainError if ratio <= 0.
  static LogFreqInterval fromRatio(double ratio);

  static LogFreqInterval unison() { return LogFreqInterval(0.0); }
  static LogFreqInterval octave();

  double value() const { return log_value_; }
  double ratio() const;

  int direction() const;
  LogFreqInterval abs() const;

  LogFreqIntervalClass ic() const;
  LogFreqIntervalClass toClass() const;
  LogFreqInterval embed() const { return *this; }

  /// @brief Ratio with opts.logfreq_precision decimals, e.g. "1.5".
  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const LogFreqInterval& other) const;

  template <typename To>
  To convertTo() const;

  LogFreqInterval operator+(const LogFreqInterval& other) const {
    return LogFreqInterval(log_value_ + other.log_value_);
  }
  LogFreqInterval operator-(const LogFreqInterval& other) const {
    return LogFreqInterval(log_value_ - other.log_value_);
  }
  LogFreqInterval operator-() const { return LogFreqInterval(-log_value_); }
  LogFreqInterval operator*(double factor) const { return LogFreqInterval(log_value_ * factor); }
  /// @throws DomainError for a zero divisor.
  LogFreqInterval operator/(double divisor) const;

  bool operator==(const LogFreqInterval& other) const { return log_value_ == other.log_value_; }
  bool operator!=(const LogFreqInterval& other) const { return log_value_ != other.log_value_; }
  bool operator<(const LogFreqInterval& other) const { return log_value_ < other.log_value_; }
  bool operator<=(const LogFreqInterval& other) const { return log_value_ <= other.log_value_; }
  bool operator>(const LogFreqInterval& other) const { return log_value_ > other.log_value_; }
  bool operator>=(const LogFreqInterval& other) const { return log_value_ >= other.log_value_; }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return false; }

 private:
  explicit LogFreqInterval(double log_value) : log_value_(log_value) {}

  double log_value_;
};

inline LogFreqInterval operator*(double factor, const LogFreqInterval& interval) {
  return interval * factor;
}

// ---------------------------------------------------------------------------
// LogFreqPitch
// ---------------------------------------------------------------------------

/// @brief A frequency stored as its natural log.
class LogFreqPitch {
 public:
  static constexpr TypeId kTypeId{Family::LogFreq, Kind::Pitch};

  /// @brief Parse a frequency with "Hz" suffix, e.g. "440Hz".
  /// @throws ParseError if the suffix is missing or the number is malformed.
  /// @throws DomainError if the frequency is not positive.
  explicit LogFreqPitch(const std::string& frequency);

  static LogFreqPitch fromLog(double log_freq) { return LogFreqPitch(log_freq); }
  /// @throws DomainError if hz <= 0.
  static LogFreqPitch fromFreq(double hz);

  double value() const { return log_value_; }
  double freq() const;

  LogFreqPitchClass pc() const;
  LogFreqPitchClass toClass() const;
  LogFreqPitch embed() const { return *this; }

  LogFreqInterval intervalFrom(const LogFreqPitch& other) const { return *this - other; }
  LogFreqInterval intervalTo(const LogFreqPitch& other) const { return other - *this; }

  /// @brief Frequency with opts.logfreq_precision decimals, e.g. "261.63Hz".
  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const LogFreqPitch& other) const;

  template <typename To>
  To convertTo() const;

  LogFreqPitch operator+(const LogFreqInterval& interval) const {
    return LogFreqPitch(log_value_ + interval.value());
  }
  LogFreqPitch operator-(const LogFreqInterval& interval) const {
    return LogFreqPitch(log_value_ - interval.value());
  }
  LogFreqInterval operator-(const LogFreqPitch& other) const {
    return LogFreqInterval::fromLog(log_value_ - other.log_value_);
  }

  bool operator==(const LogFreqPitch& other) const { return log_value_ == other.log_value_; }
  bool operator!=(const LogFreqPitch& other) const { return log_value_ != other.log_value_; }
  bool operator<(const LogFreqPitch& other) const { return log_value_ < other.log_value_; }
  bool operator<=(const LogFreqPitch& other) const { return log_value_ <= other.log_value_; }
  bool operator>(const LogFreqPitch& other) const { return log_value_ > other.log_value_; }
  bool operator>=(const LogFreqPitch& other) const { return log_value_ >= other.log_value_; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return false; }

 private:
  explicit LogFreqPitch(double log_value) : log_value_(log_value) {}

  double log_value_;
};

// ---------------------------------------------------------------------------
// LogFreqIntervalClass
// ---------------------------------------------------------------------------

/// @brief A frequency ratio modulo the octave, log value in [0, log 2).
class LogFreqIntervalClass {
 public:
  static constexpr TypeId kTypeId{Family::LogFreq, Kind::IntervalClass};
  using Scalar = double;

  /// @brief Parse a plain ratio, e.g. "1.5"; reduced into [1, 2).
  explicit LogFreqIntervalClass(const std::string& ratio);

  /// @param log_ratio Any log ratio; reduced mod log 2.
  static LogFreqIntervalClass fromLog(double log_ratio);
  /// @throws DomainError if ratio <= 0.
  static LogFreqIntervalClass fromRatio(double ratio);

  static LogFreqIntervalClass unison() { return fromLog(0.0); }
  static LogFreqIntervalClass octave() { return fromLog(0.0); }

  double value() const { return log_value_; }
  double ratio() const;

  /// @brief 0 for the unison class, 1 otherwise.
  int direction() const;
  LogFreqIntervalClass abs() const { return *this; }

  LogFreqIntervalClass ic() const { return *this; }
  LogFreqIntervalClass toClass() const { return *this; }

  /// @brief The interval with the same log ratio (within the first octave).
  LogFreqInterval embed() const { return LogFreqInterval::fromLog(log_value_); }

  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const LogFreqIntervalClass& other) const;

  template <typename To>
  To convertTo() const;

  LogFreqIntervalClass operator+(const LogFreqIntervalClass& other) const {
    return fromLog(log_value_ + other.log_value_);
  }
  LogFreqIntervalClass operator-(const LogFreqIntervalClass& other) const {
    return fromLog(log_value_ - other.log_value_);
  }
  LogFreqIntervalClass operator-() const { return fromLog(-log_value_); }
  LogFreqIntervalClass operator*(double factor) const { return fromLog(log_value_ * factor); }
  /// @throws DomainError for a zero divisor.
  LogFreqIntervalClass operator/(double divisor) const;

  bool operator==(const LogFreqIntervalClass& other) const {
    return log_value_ == other.log_value_;
  }
  bool operator!=(const LogFreqIntervalClass& other) const { return !(*this == other); }
  bool operator<(const LogFreqIntervalClass& other) const { return log_value_ < other.log_value_; }
  bool operator<=(const LogFreqIntervalClass& other) const {
    return log_value_ <= other.log_value_;
  }
  bool operator>(const LogFreqIntervalClass& other) const { return log_value_ > other.log_value_; }
  bool operator>=(const LogFreqIntervalClass& other) const {
    return log_value_ >= other.log_value_;
  }

  static constexpr bool isPitch() { return false; }
  static constexpr bool isInterval() { return true; }
  static constexpr bool isClass() { return true; }

 private:
  explicit LogFreqIntervalClass(double log_value) : log_value_(log_value) {}

  double log_value_;
};

inline LogFreqIntervalClass operator*(double factor, const LogFreqIntervalClass& ic) {
  return ic * factor;
}

// ---------------------------------------------------------------------------
// LogFreqPitchClass
// ---------------------------------------------------------------------------

/// @brief A frequency modulo the octave, log value in [0, log 2).
class LogFreqPitchClass {
 public:
  static constexpr TypeId kTypeId{Family::LogFreq, Kind::PitchClass};

  /// @brief Parse a frequency with "Hz" suffix; reduced into [1, 2) Hz.
  explicit LogFreqPitchClass(const std::string& frequency);

  /// @param log_freq Any log frequency; reduced mod log 2.
  static LogFreqPitchClass fromLog(double log_freq);
  /// @throws DomainError if hz <= 0.
  static LogFreqPitchClass fromFreq(double hz);

  double value() const { return log_value_; }

  /// @brief Representative frequency in [1, 2) Hz.
  double freq() const;

  LogFreqPitchClass pc() const { return *this; }
  LogFreqPitchClass toClass() const { return *this; }

  /// @brief The pitch with the same log value.
  LogFreqPitch embed() const { return LogFreqPitch::fromLog(log_value_); }

  LogFreqIntervalClass intervalFrom(const LogFreqPitchClass& other) const {
    return *this - other;
  }
  LogFreqIntervalClass intervalTo(const LogFreqPitchClass& other) const {
    return other - *this;
  }

  std::string name(const PrintOptions& opts = PrintOptions()) const;

  int compare(const LogFreqPitchClass& other) const;

  template <typename To>
  To convertTo() const;

  LogFreqPitchClass operator+(const LogFreqIntervalClass& ic) const {
    return fromLog(log_value_ + ic.value());
  }
  LogFreqPitchClass operator-(const LogFreqIntervalClass& ic) const {
    return fromLog(log_value_ - ic.value());
  }
  LogFreqIntervalClass operator-(const LogFreqPitchClass& other) const {
    return LogFreqIntervalClass::fromLog(log_value_ - other.log_value_);
  }

  bool operator==(const LogFreqPitchClass& other) const { return log_value_ == other.log_value_; }
  bool operator!=(const LogFreqPitchClass& other) const { return !(*this == other); }
  bool operator<(const LogFreqPitchClass& other) const { return log_value_ < other.log_value_; }
  bool operator<=(const LogFreqPitchClass& other) const { return log_value_ <= other.log_value_; }
  bool operator>(const LogFreqPitchClass& other) const { return log_value_ > other.log_value_; }
  bool operator>=(const LogFreqPitchClass& other) const { return log_value_ >= other.log_value_; }

  static constexpr bool isPitch() { return true; }
  static constexpr bool isInterval() { return false; }
  static constexpr bool isClass() { return true; }

 private:
  explicit LogFreqPitchClass(double log_value) : log_value_(log_value) {}

  double log_value_;
};

}  // namespace pitchtypes

#endif  // PITCHTYPES_LOGFREQ_LOGFREQ_H

/// @file
/// @brief Log-frequency values, octave reduction and decimal names.

#include "logfreq/logfreq.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "core/errors.h"

namespace pitchtypes {

namespace {

constexpr const char* kFrequencyGrammar = "<positive number>Hz, e.g. '440Hz', '261.63Hz'";
constexpr const char* kRatioGrammar = "<positive number>, e.g. '1.5', '2'";
constexpr const char* kHzSuffix = "Hz";

const double kLogOctave = std::log(2.0);

/// @brief Reduce a log value into [0, log 2).
double reduceToOctave(double log_value) {
  double reduced = std::fmod(log_value, kLogOctave);
  if (reduced < 0.0) reduced += kLogOctave;
  if (reduced >= kLogOctave) reduced = 0.0;
  return reduced;
}

/// @brief Natural log of a positive quantity.
/// @throws DomainError if value is not a positive finite number.
double positiveLog(double value, const char* what) {
  if (!(value > 0.0) || !std::isfinite(value)) {
    throw DomainError(std::string(what) + " must be positive, got " + std::to_string(value));
  }
  return std::log(value);
}

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

/// @brief True if text is a plain decimal: [+-]digits[.digits][(e|E)[+-]digits].
bool isDecimalNumber(const std::string& text) {
  size_t pos = 0;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
  size_t mantissa_digits = 0;
  while (pos < text.size() && isDigit(text[pos])) {
    ++pos;
    ++mantissa_digits;
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && isDigit(text[pos])) {
      ++pos;
      ++mantissa_digits;
    }
  }
  if (mantissa_digits == 0) return false;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
    size_t exp_start = pos;
    while (pos < text.size() && isDigit(text[pos])) ++pos;
    if (pos == exp_start) return false;
  }
  return pos == text.size();
}

/// @brief Parse the whole string as a decimal number.
/// @throws ParseError on empty input, non-decimal forms (hex, inf, nan),
///         trailing text or overflow.
double parseNumber(const std::string& text, const std::string& input, const char* grammar) {
  if (!isDecimalNumber(text)) throw ParseError(input, grammar);
  const char* begin = text.c_str();
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(begin, &end);
  if (end != begin + text.size() || errno == ERANGE) throw ParseError(input, grammar);
  return value;
}

double parseFrequency(const std::string& str) {
  size_t suffix_len = std::char_traits<char>::length(kHzSuffix);
  if (str.size() <= suffix_len || str.compare(str.size() - suffix_len, suffix_len, kHzSuffix) != 0) {
    throw ParseError(str, kFrequencyGrammar);
  }
  return parseNumber(str.substr(0, str.size() - suffix_len), str, kFrequencyGrammar);
}

double parseRatio(const std::string& str) { return parseNumber(str, str, kRatioGrammar); }

int signOf(double value) { return (value > 0.0) - (value < 0.0); }

double checkedDivisor(double divisor) {
  if (divisor == 0.0) throw DomainError("cannot divide a log-frequency interval by zero");
  return divisor;
}

}  // namespace

std::string formatDecimal(double value, int precision) {
  if (precision < 0) precision = 0;
  if (precision > kMaxLogFreqPrecision) precision = kMaxLogFreqPrecision;
  char buf[512];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
  std::string result(buf);
  if (result.find('.') != std::string::npos) {
    size_t last = result.find_last_not_of('0');
    if (result[last] == '.') --last;
    result.erase(last + 1);
  }
  if (result == "-0") result = "0";
  return result;
}

// ---------------------------------------------------------------------------
// LogFreqInterval
// ---------------------------------------------------------------------------

LogFreqInterval::LogFreqInterval(const std::string& ratio)
    : log_value_(positiveLog(parseRatio(ratio), "frequency ratio")) {}

LogFreqInterval LogFreqInterval::fromRatio(double ratio) {
  return LogFreqInterval(positiveLog(ratio, "frequency ratio"));
}

LogFreqInterval LogFreqInterval::octave() { return LogFreqInterval(kLogOctave); }

double LogFreqInterval::ratio() const { return std::exp(log_value_); }

int LogFreqInterval::direction() const { return signOf(log_value_); }

LogFreqInterval LogFreqInterval::abs() const { return LogFreqInterval(std::fabs(log_value_)); }

LogFreqIntervalClass LogFreqInterval::ic() const { return LogFreqIntervalClass::fromLog(log_value_); }

LogFreqIntervalClass LogFreqInterval::toClass() const { return ic(); }

std::string LogFreqInterval::name(const PrintOptions& opts) const {
  return formatDecimal(ratio(), opts.logfreq_precision);
}

int LogFreqInterval::compare(const LogFreqInterval& other) const {
  return signOf(log_value_ - other.log_value_);
}

LogFreqInterval LogFreqInterval::operator/(double divisor) const {
  return LogFreqInterval(log_value_ / checkedDivisor(divisor));
}

// ---------------------------------------------------------------------------
// LogFreqPitch
// ---------------------------------------------------------------------------

LogFreqPitch::LogFreqPitch(const std::string& frequency)
    : log_value_(positiveLog(parseFrequency(frequency), "frequency")) {}

LogFreqPitch LogFreqPitch::fromFreq(double hz) { return LogFreqPitch(positiveLog(hz, "frequency")); }

double LogFreqPitch::freq() const { return std::exp(log_value_); }

LogFreqPitchClass LogFreqPitch::pc() const { return LogFreqPitchClass::fromLog(log_value_); }

LogFreqPitchClass LogFreqPitch::toClass() const { return pc(); }

std::string LogFreqPitch::name(const PrintOptions& opts) const {
  return formatDecimal(freq(), opts.logfreq_precision) + kHzSuffix;
}

int LogFreqPitch::compare(const LogFreqPitch& other) const {
  return signOf(log_value_ - other.log_value_);
}

// ---------------------------------------------------------------------------
// LogFreqIntervalClass
// ---------------------------------------------------------------------------

LogFreqIntervalClass::LogFreqIntervalClass(const std::string& ratio)
    : log_value_(reduceToOctave(positiveLog(parseRatio(ratio), "frequency ratio"))) {}

LogFreqIntervalClass LogFreqIntervalClass::fromLog(double log_ratio) {
  return LogFreqIntervalClass(reduceToOctave(log_ratio));
}

LogFreqIntervalClass LogFreqIntervalClass::fromRatio(double ratio) {
  return fromLog(positiveLog(ratio, "frequency ratio"));
}

double LogFreqIntervalClass::ratio() const { return std::exp(log_value_); }

int LogFreqIntervalClass::direction() const { return signOf(log_value_); }

std::string LogFreqIntervalClass::name(const PrintOptions& opts) const {
  return formatDecimal(ratio(), opts.logfreq_precision);
}

int LogFreqIntervalClass::compare(const LogFreqIntervalClass& other) const {
  return signOf(log_value_ - other.log_value_);
}

LogFreqIntervalClass LogFreqIntervalClass::operator/(double divisor) const {
  return fromLog(log_value_ / checkedDivisor(divisor));
}

// ---------------------------------------------------------------------------
// LogFreqPitchClass
// ---------------------------------------------------------------------------

LogFreqPitchClass::LogFreqPitchClass(const std::string& frequency)
    : log_value_(reduceToOctave(positiveLog(parseFrequency(frequency), "frequency"))) {}

LogFreqPitchClass LogFreqPitchClass::fromLog(double log_freq) {
  return LogFreqPitchClass(reduceToOctave(log_freq));
}

LogFreqPitchClass LogFreqPitchClass::fromFreq(double hz) {
  return fromLog(positiveLog(hz, "frequency"));
}

double LogFreqPitchClass::freq() const { return std::exp(log_value_); }

std::string LogFreqPitchClass::name(const PrintOptions& opts) const {
  return formatDecimal(freq(), opts.logfreq_precision) + kHzSuffix;
}

int LogFreqPitchClass::compare(const LogFreqPitchClass& other) const {
  return signOf(log_value_ - other.log_value_);
}

}  // namespace pitchtypes

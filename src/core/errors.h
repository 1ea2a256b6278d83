// Error taxonomy for pitch and interval values -- parse, domain, type and
// conversion failures.

#ifndef PITCHTYPES_CORE_ERRORS_H
#define PITCHTYPES_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace pitchtypes {

/// @brief Malformed notation string.
///
/// Carries the offending input and a description of the expected grammar.
class ParseError : public std::invalid_argument {
 public:
  /// @param input The string that failed to parse.
  /// @param grammar Human-readable description of the accepted notation.
  ParseError(const std::string& input, const std::string& grammar);

  const std::string& input() const { return input_; }
  const std::string& grammar() const { return grammar_; }

 private:
  std::string input_;
  std::string grammar_;
};

/// @brief Numeric value outside the legal domain of an operation.
class DomainError : public std::domain_error {
 public:
  explicit DomainError(const std::string& message);
};

/// @brief Operation applied to incompatible kinds of values.
///
/// Raised for class/non-class mixing, pitch + pitch, cross-family operands
/// and scaling of pitches. Names both operand types and the operator.
class TypeMismatchError : public std::logic_error {
 public:
  TypeMismatchError(const std::string& op, const std::string& lhs, const std::string& rhs);

  /// @brief Construct with a free-form message (no operand pair).
  explicit TypeMismatchError(const std::string& message);

  const std::string& op() const { return op_; }
  const std::string& lhs() const { return lhs_; }
  const std::string& rhs() const { return rhs_; }

 private:
  std::string op_;
  std::string lhs_;
  std::string rhs_;
};

/// @brief No converter is registered between two value types.
class ConversionNotFoundError : public std::runtime_error {
 public:
  ConversionNotFoundError(const std::string& from, const std::string& to);
};

/// @brief A converter already exists and the matching overwrite flag was not set.
class ConverterExistsError : public std::invalid_argument {
 public:
  explicit ConverterExistsError(const std::string& message);
};

/// @brief A registered converter returned a value of the wrong type.
///
/// Signals a bug in the converter, not bad user input.
class ConversionConsistencyError : public std::logic_error {
 public:
  explicit ConversionConsistencyError(const std::string& message);
};

}  // namespace pitchtypes

#endif  // PITCHTYPES_CORE_ERRORS_H

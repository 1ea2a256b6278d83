/// @file
/// @brief Error message formatting for the pitchtypes exception classes.

#include "core/errors.h"

namespace pitchtypes {

ParseError::ParseError(const std::string& input, const std::string& grammar)
    : std::invalid_argument("could not parse '" + input + "' (expected " + grammar + ")"),
      input_(input),
      grammar_(grammar) {}

DomainError::DomainError(const std::string& message) : std::domain_error(message) {}

TypeMismatchError::TypeMismatchError(const std::string& op, const std::string& lhs,
                                     const std::string& rhs)
    : std::logic_error("operation '" + op + "' is undefined for " + lhs + " and " + rhs),
      op_(op),
      lhs_(lhs),
      rhs_(rhs) {}

TypeMismatchError::TypeMismatchError(const std::string& message) : std::logic_error(message) {}

ConversionNotFoundError::ConversionNotFoundError(const std::string& from, const std::string& to)
    : std::runtime_error("no converter registered from " + from + " to " + to) {}

ConverterExistsError::ConverterExistsError(const std::string& message)
    : std::invalid_argument(message) {}

ConversionConsistencyError::ConversionConsistencyError(const std::string& message)
    : std::logic_error(message) {}

}  // namespace pitchtypes

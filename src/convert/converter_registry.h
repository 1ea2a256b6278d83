// Conversion registry -- maps (source type, target type) to a pipeline of
// single-hop converters and runs it with result checking.
//
// Pipelines of length 1 are explicit (registered directly); longer pipelines
// are implicit (synthesized by chaining when create_implicit is set).

#ifndef PITCHTYPES_CONVERT_CONVERTER_REGISTRY_H
#define PITCHTYPES_CONVERT_CONVERTER_REGISTRY_H

#include <functional>
#include <map>
#include <utility>
#include <vector>

#include "convert/any_value.h"
#include "core/errors.h"
#include "core/value_kind.h"

namespace pitchtypes {

/// @brief Flags for ConverterRegistry::registerConverter.
struct RegisterOptions {
  /// Replace an existing explicit (single-step) converter.
  bool overwrite_explicit = false;
  /// Replace an existing implicit (chained) converter.
  bool overwrite_implicit = false;
  /// Chain the new converter with existing ones: X -> from gains X -> to,
  /// and to -> Y gains from -> Y, where no converter exists yet.
  bool create_implicit = false;
};

/// @brief Registry of conversion pipelines between value types.
///
/// The default registry (instance()) is built once on first use and is
/// read-only afterwards. Separate registries can be built for tests or
/// alternative conversion graphs.
class ConverterRegistry {
 public:
  using Converter = std::function<AnyValue(const AnyValue&)>;
  using Pipeline = std::vector<Converter>;

  /// @param verbose Log registrations and synthesized converters to stderr.
  explicit ConverterRegistry(bool verbose = false) : verbose_(verbose) {}

  /// @brief Register a converter from one type to another.
  /// @throws TypeMismatchError if from == to.
  /// @throws ConverterExistsError if a converter exists and the matching
  ///         overwrite flag is not set.
  void registerConverter(TypeId from, TypeId to, Converter converter,
                         const RegisterOptions& opts = RegisterOptions());

  /// @brief Register a statically typed converter function.
  ///
  /// The wrapper checks the input alternative, so a broken upstream step
  /// surfaces as ConversionConsistencyError.
  template <typename From, typename To, typename Fn>
  void registerTypedConverter(Fn fn, const RegisterOptions& opts = RegisterOptions()) {
    registerConverter(
        From::kTypeId, To::kTypeId,
        [fn](const AnyValue& value) -> AnyValue {
          const From* input = std::get_if<From>(&value);
          if (input == nullptr) {
            throw ConversionConsistencyError("converter to " + typeName(To::kTypeId) +
                                             " expected " + typeName(From::kTypeId) + ", got " +
                                             typeName(typeOf(value)));
          }
          return AnyValue(To(fn(*input)));
        },
        opts);
  }

  /// @brief The pipeline converting from -> to.
  /// @throws ConversionNotFoundError if none is registered.
  const Pipeline& pipeline(TypeId from, TypeId to) const;

  /// @brief Whether a pipeline from -> to is registered.
  bool hasConverter(TypeId from, TypeId to) const;

  /// @brief All types reachable from a type, in TypeId order.
  std::vector<TypeId> targets(TypeId from) const;

  /// @brief Convert a value to the target type.
  ///
  /// Same-type conversion returns the value unchanged. Otherwise the pipeline
  /// runs left to right and the result must have the target type and the
  /// source's pitch/interval and class flags.
  /// @throws ConversionNotFoundError if no pipeline is registered.
  /// @throws ConversionConsistencyError if a converter returns a wrong type.
  AnyValue convert(const AnyValue& value, TypeId to) const;

  /// @brief The process-wide default registry.
  static const ConverterRegistry& instance();

 private:
  void log(const char* action, TypeId from, TypeId to, size_t steps) const;

  std::map<TypeId, std::map<TypeId, Pipeline>> converters_;
  bool verbose_;
};

/// @brief Register the library's conversion graph.
///
/// Spelled -> Enharmonic for all four kinds, then Enharmonic -> LogFreq with
/// implicit chaining, which also yields Spelled -> LogFreq.
void registerDefaultConverters(ConverterRegistry& registry);

}  // namespace pitchtypes

#endif  // PITCHTYPES_CONVERT_CONVERTER_REGISTRY_H

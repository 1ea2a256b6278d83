/// @file
/// @brief Conversion pipelines, implicit chaining and the default graph.

#include "convert/converter_registry.h"

#include <cstdio>

#include "convert/converters.h"

namespace pitchtypes {

void ConverterRegistry::registerConverter(TypeId from, TypeId to, Converter converter,
                                          const RegisterOptions& opts) {
  if (from == to) {
    throw TypeMismatchError("cannot register a converter from " + typeName(from) +
                            " to itself");
  }

  auto& from_map = converters_[from];
  auto existing = from_map.find(to);
  if (existing != from_map.end()) {
    bool is_explicit = existing->second.size() == 1;
    if (is_explicit && !opts.overwrite_explicit) {
      throw ConverterExistsError("an explicit converter from " + typeName(from) + " to " +
                                 typeName(to) + " already exists (set overwrite_explicit)");
    }
    if (!is_explicit && !opts.overwrite_implicit) {
      throw ConverterExistsError("an implicit converter from " + typeName(from) + " to " +
                                 typeName(to) + " already exists (set overwrite_implicit)");
    }
  }
  from_map[to] = Pipeline{converter};
  log("registered", from, to, 1);

  if (!opts.create_implicit) return;

  // Collect first: the maps must not change while they are walked.
  std::vector<std::pair<TypeId, Pipeline>> prepended;                   // from -> Y
  std::vector<std::pair<TypeId, std::pair<TypeId, Pipeline>>> appended;  // X -> to
  for (const auto& outer : converters_) {
    TypeId other_from = outer.first;
    for (const auto& inner : outer.second) {
      TypeId other_to = inner.first;
      const Pipeline& other_pipe = inner.second;
      if (other_from == to && other_to != from) {
        Pipeline chained{converter};
        chained.insert(chained.end(), other_pipe.begin(), other_pipe.end());
        prepended.emplace_back(other_to, std::move(chained));
      }
      if (other_to == from && other_from != to) {
        Pipeline chained = other_pipe;
        chained.push_back(converter);
        appended.emplace_back(other_from, std::make_pair(to, std::move(chained)));
      }
    }
  }

  for (auto& entry : prepended) {
    if (from_map.count(entry.first) != 0) continue;
    log("implicit", from, entry.first, entry.second.size());
    from_map.emplace(entry.first, std::move(entry.second));
  }
  for (auto& entry : appended) {
    auto& other_map = converters_[entry.first];
    if (other_map.count(entry.second.first) != 0) continue;
    log("implicit", entry.first, entry.second.first, entry.second.second.size());
    other_map.emplace(entry.second.first, std::move(entry.second.second));
  }
}

const ConverterRegistry::Pipeline& ConverterRegistry::pipeline(TypeId from, TypeId to) const {
  auto outer = converters_.find(from);
  if (outer != converters_.end()) {
    auto inner = outer->second.find(to);
    if (inner != outer->second.end()) return inner->second;
  }
  throw ConversionNotFoundError(typeName(from), typeName(to));
}

bool ConverterRegistry::hasConverter(TypeId from, TypeId to) const {
  auto outer = converters_.find(from);
  return outer != converters_.end() && outer->second.count(to) != 0;
}

std::vector<TypeId> ConverterRegistry::targets(TypeId from) const {
  std::vector<TypeId> result;
  auto outer = converters_.find(from);
  if (outer == converters_.end()) return result;
  result.reserve(outer->second.size());
  for (const auto& entry : outer->second) result.push_back(entry.first);
  return result;
}

AnyValue ConverterRegistry::convert(const AnyValue& value, TypeId to) const {
  TypeId from = typeOf(value);
  if (from == to) return value;

  AnyValue result = value;
  for (const auto& step : pipeline(from, to)) {
    result = step(result);
  }

  TypeId produced = typeOf(result);
  if (produced != to || !sameKind(produced.kind, from.kind)) {
    throw ConversionConsistencyError("conversion from " + typeName(from) + " to " +
                                     typeName(to) + " produced " + typeName(produced));
  }
  return result;
}

const ConverterRegistry& ConverterRegistry::instance() {
  static const ConverterRegistry registry = [] {
    ConverterRegistry reg;
    registerDefaultConverters(reg);
    return reg;
  }();
  return registry;
}

void ConverterRegistry::log(const char* action, TypeId from, TypeId to, size_t steps) const {
  if (!verbose_) return;
  std::fprintf(stderr, "[ConverterRegistry] %s %s -> %s (%zu step%s)\n", action,
               typeName(from).c_str(), typeName(to).c_str(), steps, steps == 1 ? "" : "s");
}

void registerDefaultConverters(ConverterRegistry& registry) {
  registry.registerTypedConverter<SpelledPitch, EnharmonicPitch>(
      [](const SpelledPitch& val) { return toEnharmonic(val); });
  registry.registerTypedConverter<SpelledInterval, EnharmonicInterval>(
      [](const SpelledInterval& val) { return toEnharmonic(val); });
  registry.registerTypedConverter<SpelledPitchClass, EnharmonicPitchClass>(
      [](const SpelledPitchClass& val) { return toEnharmonic(val); });
  registry.registerTypedConverter<SpelledIntervalClass, EnharmonicIntervalClass>(
      [](const SpelledIntervalClass& val) { return toEnharmonic(val); });

  RegisterOptions chain;
  chain.create_implicit = true;
  registry.registerTypedConverter<EnharmonicPitch, LogFreqPitch>(
      [](const EnharmonicPitch& val) { return toLogFreq(val); }, chain);
  registry.registerTypedConverter<EnharmonicInterval, LogFreqInterval>(
      [](const EnharmonicInterval& val) { return toLogFreq(val); }, chain);
  registry.registerTypedConverter<EnharmonicPitchClass, LogFreqPitchClass>(
      [](const EnharmonicPitchClass& val) { return toLogFreq(val); }, chain);
  registry.registerTypedConverter<EnharmonicIntervalClass, LogFreqIntervalClass>(
      [](const EnharmonicIntervalClass& val) { return toLogFreq(val); }, chain);
}

}  // namespace pitchtypes

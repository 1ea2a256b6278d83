// Tests for convert/converter_registry.h and convert/convert.h -- explicit and
// implicit pipelines, overwrite rules, result checking and the default graph.

#include "convert/converter_registry.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "convert/convert.h"
#include "convert/converters.h"
#include "core/errors.h"

namespace pitchtypes {
namespace {

constexpr double kTolerance = 1e-9;

void registerSpelledToEnharmonicPitch(ConverterRegistry& registry,
                                      const RegisterOptions& opts = RegisterOptions()) {
  registry.registerTypedConverter<SpelledPitch, EnharmonicPitch>(
      [](const SpelledPitch& val) { return toEnharmonic(val); }, opts);
}

void registerEnharmonicToLogFreqPitch(ConverterRegistry& registry,
                                      const RegisterOptions& opts = RegisterOptions()) {
  registry.registerTypedConverter<EnharmonicPitch, LogFreqPitch>(
      [](const EnharmonicPitch& val) { return toLogFreq(val); }, opts);
}

RegisterOptions withImplicit() {
  RegisterOptions opts;
  opts.create_implicit = true;
  return opts;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

TEST(ConverterRegistryTest, ExplicitConverterRuns) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  ASSERT_TRUE(registry.hasConverter(SpelledPitch::kTypeId, EnharmonicPitch::kTypeId));
  EXPECT_EQ(registry.pipeline(SpelledPitch::kTypeId, EnharmonicPitch::kTypeId).size(), 1u);

  AnyValue result = registry.convert(AnyValue(SpelledPitch("C#4")), EnharmonicPitch::kTypeId);
  EXPECT_EQ(std::get<EnharmonicPitch>(result).midi(), 61);
}

TEST(ConverterRegistryTest, SameTypeIsIdentity) {
  ConverterRegistry registry;
  AnyValue value(SpelledPitch("Eb2"));
  AnyValue result = registry.convert(value, SpelledPitch::kTypeId);
  EXPECT_EQ(std::get<SpelledPitch>(result), SpelledPitch("Eb2"));
}

TEST(ConverterRegistryTest, SelfConverterRejected) {
  ConverterRegistry registry;
  EXPECT_THROW(registry.registerConverter(SpelledPitch::kTypeId, SpelledPitch::kTypeId,
                                          [](const AnyValue& val) { return val; }),
               TypeMismatchError);
}

TEST(ConverterRegistryTest, ExplicitOverwriteNeedsFlag) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  EXPECT_THROW(registerSpelledToEnharmonicPitch(registry), ConverterExistsError);

  RegisterOptions implicit_only;
  implicit_only.overwrite_implicit = true;
  EXPECT_THROW(registerSpelledToEnharmonicPitch(registry, implicit_only), ConverterExistsError);

  RegisterOptions overwrite;
  overwrite.overwrite_explicit = true;
  registry.registerTypedConverter<SpelledPitch, EnharmonicPitch>(
      [](const SpelledPitch&) { return EnharmonicPitch(0); }, overwrite);
  AnyValue result = registry.convert(AnyValue(SpelledPitch("C4")), EnharmonicPitch::kTypeId);
  EXPECT_EQ(std::get<EnharmonicPitch>(result).midi(), 0);
}

TEST(ConverterRegistryTest, ImplicitOverwriteNeedsFlag) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  registerEnharmonicToLogFreqPitch(registry, withImplicit());
  ASSERT_EQ(registry.pipeline(SpelledPitch::kTypeId, LogFreqPitch::kTypeId).size(), 2u);

  auto direct = [](const SpelledPitch&) { return LogFreqPitch::fromFreq(1.0); };
  EXPECT_THROW((registry.registerTypedConverter<SpelledPitch, LogFreqPitch>(direct)),
               ConverterExistsError);

  RegisterOptions overwrite;
  overwrite.overwrite_implicit = true;
  registry.registerTypedConverter<SpelledPitch, LogFreqPitch>(direct, overwrite);
  EXPECT_EQ(registry.pipeline(SpelledPitch::kTypeId, LogFreqPitch::kTypeId).size(), 1u);
  EXPECT_NEAR(convertTo<LogFreqPitch>(SpelledPitch("A4"), registry).freq(), 1.0, kTolerance);
}

// ---------------------------------------------------------------------------
// Implicit chaining
// ---------------------------------------------------------------------------

TEST(ConverterRegistryTest, ImplicitChainAppendsToExistingSources) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  registerEnharmonicToLogFreqPitch(registry, withImplicit());

  ASSERT_TRUE(registry.hasConverter(SpelledPitch::kTypeId, LogFreqPitch::kTypeId));
  LogFreqPitch a4 = convertTo<LogFreqPitch>(SpelledPitch("A4"), registry);
  EXPECT_NEAR(a4.freq(), 440.0, kTolerance);
}

TEST(ConverterRegistryTest, ImplicitChainPrependsToExistingTargets) {
  ConverterRegistry registry;
  registerEnharmonicToLogFreqPitch(registry);
  registerSpelledToEnharmonicPitch(registry, withImplicit());

  ASSERT_TRUE(registry.hasConverter(SpelledPitch::kTypeId, LogFreqPitch::kTypeId));
  EXPECT_EQ(registry.pipeline(SpelledPitch::kTypeId, LogFreqPitch::kTypeId).size(), 2u);
  EXPECT_NEAR(convertTo<LogFreqPitch>(SpelledPitch("A3"), registry).freq(), 220.0, kTolerance);
}

TEST(ConverterRegistryTest, WithoutImplicitFlagNothingIsChained) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  registerEnharmonicToLogFreqPitch(registry);
  EXPECT_FALSE(registry.hasConverter(SpelledPitch::kTypeId, LogFreqPitch::kTypeId));
  EXPECT_THROW(registry.convert(AnyValue(SpelledPitch("A4")), LogFreqPitch::kTypeId),
               ConversionNotFoundError);
}

TEST(ConverterRegistryTest, ImplicitChainKeepsExistingConverters) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  registry.registerTypedConverter<SpelledPitch, LogFreqPitch>(
      [](const SpelledPitch&) { return LogFreqPitch::fromFreq(1.0); });
  registerEnharmonicToLogFreqPitch(registry, withImplicit());

  EXPECT_EQ(registry.pipeline(SpelledPitch::kTypeId, LogFreqPitch::kTypeId).size(), 1u);
  EXPECT_NEAR(convertTo<LogFreqPitch>(SpelledPitch("A4"), registry).freq(), 1.0, kTolerance);
}

TEST(ConverterRegistryTest, ImplicitChainSkipsRoundTrips) {
  ConverterRegistry registry;
  registerSpelledToEnharmonicPitch(registry);
  registry.registerTypedConverter<EnharmonicPitch, SpelledPitch>(
      [](const EnharmonicPitch& val) {
        return SpelledPitch::fromFifthsAndIndependentOctave(0, val.octaves());
      },
      withImplicit());
  EXPECT_FALSE(registry.hasConverter(SpelledPitch::kTypeId, SpelledPitch::kTypeId));
  EXPECT_FALSE(registry.hasConverter(EnharmonicPitch::kTypeId, EnharmonicPitch::kTypeId));
}

// ---------------------------------------------------------------------------
// Lookup failures and result checking
// ---------------------------------------------------------------------------

TEST(ConverterRegistryTest, MissingPipelineThrows) {
  ConverterRegistry registry;
  EXPECT_FALSE(registry.hasConverter(LogFreqPitch::kTypeId, SpelledPitch::kTypeId));
  EXPECT_THROW(registry.pipeline(LogFreqPitch::kTypeId, SpelledPitch::kTypeId),
               ConversionNotFoundError);
  EXPECT_TRUE(registry.targets(LogFreqPitch::kTypeId).empty());
}

TEST(ConverterRegistryTest, WrongResultTypeIsConsistencyError) {
  ConverterRegistry registry;
  registry.registerConverter(SpelledPitch::kTypeId, EnharmonicPitch::kTypeId,
                             [](const AnyValue&) { return AnyValue(EnharmonicInterval(3)); });
  EXPECT_THROW(registry.convert(AnyValue(SpelledPitch("C4")), EnharmonicPitch::kTypeId),
               ConversionConsistencyError);
}

TEST(ConverterRegistryTest, CrossKindEdgeIsConsistencyError) {
  ConverterRegistry registry;
  registry.registerConverter(SpelledPitch::kTypeId, EnharmonicInterval::kTypeId,
                             [](const AnyValue&) { return AnyValue(EnharmonicInterval(3)); });
  EXPECT_THROW(registry.convert(AnyValue(SpelledPitch("C4")), EnharmonicInterval::kTypeId),
               ConversionConsistencyError);
}

TEST(ConverterRegistryTest, BrokenUpstreamStepIsConsistencyError) {
  ConverterRegistry registry;
  registry.registerConverter(SpelledPitch::kTypeId, EnharmonicPitch::kTypeId,
                             [](const AnyValue&) { return AnyValue(EnharmonicInterval(3)); });
  registerEnharmonicToLogFreqPitch(registry, withImplicit());
  EXPECT_THROW(registry.convert(AnyValue(SpelledPitch("C4")), LogFreqPitch::kTypeId),
               ConversionConsistencyError);
}

TEST(ConverterRegistryTest, VerboseRegistryLogsToStderr) {
  ConverterRegistry registry(true);
  testing::internal::CaptureStderr();
  registerSpelledToEnharmonicPitch(registry);
  registerEnharmonicToLogFreqPitch(registry, withImplicit());
  std::string output = testing::internal::GetCapturedStderr();
  EXPECT_NE(output.find("[ConverterRegistry] registered SpelledPitch -> EnharmonicPitch"),
            std::string::npos);
  EXPECT_NE(output.find("implicit SpelledPitch -> LogFreqPitch (2 steps)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Default graph
// ---------------------------------------------------------------------------

TEST(DefaultConvertersTest, SpelledReachesEveryFamily) {
  const ConverterRegistry& registry = ConverterRegistry::instance();
  std::vector<TypeId> targets = registry.targets(SpelledPitch::kTypeId);
  ASSERT_EQ(targets.size(), 2u);
  EXPECT_EQ(targets[0], EnharmonicPitch::kTypeId);
  EXPECT_EQ(targets[1], LogFreqPitch::kTypeId);
  EXPECT_EQ(registry.pipeline(SpelledInterval::kTypeId, LogFreqInterval::kTypeId).size(), 2u);
  EXPECT_EQ(registry.pipeline(SpelledIntervalClass::kTypeId, EnharmonicIntervalClass::kTypeId)
                .size(),
            1u);
}

TEST(DefaultConvertersTest, NoBackwardOrCrossKindEdges) {
  const ConverterRegistry& registry = ConverterRegistry::instance();
  EXPECT_FALSE(registry.hasConverter(EnharmonicPitch::kTypeId, SpelledPitch::kTypeId));
  EXPECT_FALSE(registry.hasConverter(LogFreqPitch::kTypeId, EnharmonicPitch::kTypeId));
  EXPECT_FALSE(registry.hasConverter(SpelledPitch::kTypeId, SpelledPitchClass::kTypeId));
  EXPECT_FALSE(registry.hasConverter(SpelledPitch::kTypeId, EnharmonicPitchClass::kTypeId));
  EXPECT_THROW(convertTo<SpelledPitch>(EnharmonicPitch(60)), ConversionNotFoundError);
}

TEST(DefaultConvertersTest, EveryEdgeKeepsKindAndReachesTarget) {
  const ConverterRegistry& registry = ConverterRegistry::instance();
  const AnyValue samples[] = {AnyValue(SpelledPitch("F#3")), AnyValue(SpelledInterval("-m6:1")),
                              AnyValue(SpelledPitchClass("Ab")),
                              AnyValue(SpelledIntervalClass("a4")), AnyValue(EnharmonicPitch(70)),
                              AnyValue(EnharmonicInterval(-5)), AnyValue(EnharmonicPitchClass(3)),
                              AnyValue(EnharmonicIntervalClass(8))};
  for (const AnyValue& sample : samples) {
    TypeId from = typeOf(sample);
    std::vector<TypeId> targets = registry.targets(from);
    EXPECT_FALSE(targets.empty()) << typeName(from);
    for (TypeId to : targets) {
      AnyValue result = registry.convert(sample, to);
      EXPECT_EQ(typeOf(result), to) << typeName(from) << " -> " << typeName(to);
      EXPECT_EQ(typeOf(result).kind, from.kind);
    }
  }
}

TEST(DefaultConvertersTest, ConvertToFreeFunction) {
  EXPECT_EQ(convertTo<EnharmonicPitch>(SpelledPitch("C#4")).midi(), 61);
  EXPECT_EQ(convertTo<EnharmonicInterval>(SpelledInterval("-P5:1")).semitones(), -19);
  EXPECT_EQ(convertTo<EnharmonicPitchClass>(SpelledPitchClass("Gb")).value(), 6);
  EXPECT_NEAR(convertTo<LogFreqPitch>(SpelledPitch("A4")).freq(), 440.0, kTolerance);
  EXPECT_NEAR(convertTo<LogFreqInterval>(SpelledInterval("P1:1")).ratio(), 2.0, kTolerance);
  EXPECT_NEAR(convertTo<LogFreqIntervalClass>(SpelledIntervalClass("P5")).ratio(),
              std::pow(2.0, 7.0 / 12.0), kTolerance);
  EXPECT_EQ(convertTo<SpelledPitch>(SpelledPitch("F#2")), SpelledPitch("F#2"));
}

TEST(DefaultConvertersTest, MemberConvertTo) {
  EXPECT_EQ(SpelledPitch("Db4").convertTo<EnharmonicPitch>().midi(), 61);
  EXPECT_NEAR(SpelledPitch("A4").convertTo<LogFreqPitch>().freq(), 440.0, kTolerance);
  EXPECT_NEAR(EnharmonicPitch(81).convertTo<LogFreqPitch>().freq(), 880.0, kTolerance);
  EXPECT_NEAR(EnharmonicPitch("A4").convertTo<LogFreqPitch>().freq(), 440.0, kTolerance);
  EXPECT_NEAR(SpelledPitchClass("A").convertTo<LogFreqPitchClass>().freq(), 1.71875,
              kTolerance);
  EXPECT_EQ(SpelledIntervalClass("-m3").convertTo<EnharmonicIntervalClass>().value(), 9);
}

}  // namespace
}  // namespace pitchtypes

/// @file
/// @brief Spelled -> Enharmonic -> LogFreq single-hop conversions.

#include "convert/converters.h"

#include <cmath>

#include "core/line_of_fifths.h"

namespace pitchtypes {

namespace {

/// @brief Semitones above C of the pitch class at `fifths` (may leave 0..11).
///
/// Counts fifths from F so that the natural letters fall on 0..6; the
/// remainder picks the natural's semitone and the quotient adds accidentals.
int semitonesAboveC(int fifths) {
  int from_f = fifths + 1;
  int natural = lof::floorMod((lof::floorMod(from_f, lof::kFifthsPerAccidental) - 1) * 7,
                              kSemitonesPerOctave);
  int accidentals = lof::floorDiv(from_f, lof::kFifthsPerAccidental);
  return natural + accidentals;
}

/// Log of an equal-tempered interval of `semitones`.
double semitonesToLog(int semitones) {
  return std::log(std::pow(2.0, semitones / 12.0));
}

}  // namespace

EnharmonicPitch toEnharmonic(const SpelledPitch& pitch) {
  return EnharmonicPitch(kSemitonesPerOctave * (pitch.octaves() + 1) +
                         semitonesAboveC(pitch.fifths()));
}

EnharmonicInterval toEnharmonic(const SpelledInterval& interval) {
  // Measure through a reference pitch so octave bookkeeping matches pitches.
  const SpelledPitch reference = SpelledPitch::fromFifthsAndIndependentOctave(0, 4);
  return toEnharmonic(reference) - toEnharmonic(reference - interval);
}

EnharmonicPitchClass toEnharmonic(const SpelledPitchClass& pitch_class) {
  return EnharmonicPitchClass(semitonesAboveC(pitch_class.fifths()));
}

EnharmonicIntervalClass toEnharmonic(const SpelledIntervalClass& interval_class) {
  const SpelledPitchClass reference = SpelledPitchClass::fromFifths(0);
  return toEnharmonic(reference) - toEnharmonic(reference - interval_class);
}

LogFreqPitch toLogFreq(const EnharmonicPitch& pitch) {
  return LogFreqPitch::fromLog(std::log(pitch.freq()));
}

LogFreqInterval toLogFreq(const EnharmonicInterval& interval) {
  return LogFreqInterval::fromLog(semitonesToLog(interval.semitones()));
}

LogFreqPitchClass toLogFreq(const EnharmonicPitchClass& pitch_class) {
  return LogFreqPitchClass::fromLog(std::log(midiToFrequency(pitch_class.value())));
}

LogFreqIntervalClass toLogFreq(const EnharmonicIntervalClass& interval_class) {
  return LogFreqIntervalClass::fromLog(semitonesToLog(interval_class.semitones()));
}

}  // namespace pitchtypes

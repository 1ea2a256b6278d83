// Single-hop converters between representation families -- the edges the
// default conversion registry is built from.
//
// Spelled -> Enharmonic is exact but lossy (C#4 and Db4 both give 61);
// Enharmonic -> LogFreq uses 12-tone equal temperament with A4 = 440 Hz.

#ifndef PITCHTYPES_CONVERT_CONVERTERS_H
#define PITCHTYPES_CONVERT_CONVERTERS_H

#include "enharmonic/enharmonic.h"
#include "logfreq/logfreq.h"
#include "spelled/spelled.h"

namespace pitchtypes {

// ---------------------------------------------------------------------------
// Spelled -> Enharmonic
// ---------------------------------------------------------------------------

/// @brief MIDI number of a spelled pitch (C4 = 60, C#4 = Db4 = 61).
EnharmonicPitch toEnharmonic(const SpelledPitch& pitch);

/// @brief Semitone count of a spelled interval (M3:0 = 4, -m2:0 = -1).
EnharmonicInterval toEnharmonic(const SpelledInterval& interval);

/// @brief Pitch class 0-11 of a spelled pitch class (Cb = 11, B# = 0).
EnharmonicPitchClass toEnharmonic(const SpelledPitchClass& pitch_class);

/// @brief Semitone class 0-11 of a spelled interval class.
EnharmonicIntervalClass toEnharmonic(const SpelledIntervalClass& interval_class);

// ---------------------------------------------------------------------------
// Enharmonic -> LogFreq
// ---------------------------------------------------------------------------

LogFreqPitch toLogFreq(const EnharmonicPitch& pitch);
LogFreqInterval toLogFreq(const EnharmonicInterval& interval);
LogFreqPitchClass toLogFreq(const EnharmonicPitchClass& pitch_class);
LogFreqIntervalClass toLogFreq(const EnharmonicIntervalClass& interval_class);

}  // namespace pitchtypes

#endif  // PITCHTYPES_CONVERT_CONVERTERS_H

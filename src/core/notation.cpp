/// @file
/// @brief Hand-written scanners for pitch and interval notation.

#include "core/notation.h"

#include <climits>

#include "core/errors.h"
#include "core/line_of_fifths.h"

namespace pitchtypes {
namespace notation {

const char* const kPitchGrammar =
    "<A-G><'#'*|'b'*|'♯'*|'♭'*><octave?>, e.g. 'C#4', 'Eb', 'F##-1'";

const char* const kIntervalGrammar =
    "<[+-]?><P|M|m|a+|d+><1-7><(:octave)?> with P only for 1/4/5 and M/m only for "
    "2/3/6/7, e.g. 'M6:0', '-m3', 'aa2:1'";

namespace {

/// UTF-8 encodings of the Unicode sharp and flat signs.
constexpr const char* kUnicodeSharp = "♯";
constexpr const char* kUnicodeFlat = "♭";
constexpr size_t kUnicodeSignLength = 3;

/// @brief Accidental spelling seen so far in a pitch token.
enum class AccidentalKind { None, AsciiSharp, AsciiFlat, UnicodeSharp, UnicodeFlat };

/// @brief Match one accidental at pos; advances pos on success.
AccidentalKind matchAccidental(const std::string& str, size_t& pos) {
  if (pos >= str.size()) return AccidentalKind::None;
  if (str[pos] == '#') {
    ++pos;
    return AccidentalKind::AsciiSharp;
  }
  if (str[pos] == 'b') {
    ++pos;
    return AccidentalKind::AsciiFlat;
  }
  if (str.compare(pos, kUnicodeSignLength, kUnicodeSharp) == 0) {
    pos += kUnicodeSignLength;
    return AccidentalKind::UnicodeSharp;
  }
  if (str.compare(pos, kUnicodeSignLength, kUnicodeFlat) == 0) {
    pos += kUnicodeSignLength;
    return AccidentalKind::UnicodeFlat;
  }
  return AccidentalKind::None;
}

/// @brief Scan an optionally negative decimal integer spanning [pos, end).
/// @param out Parsed value.
/// @return False if the range is empty, contains a non-digit, or overflows int.
bool scanSignedInt(const std::string& str, size_t pos, int& out) {
  bool negative = false;
  if (pos < str.size() && str[pos] == '-') {
    negative = true;
    ++pos;
  }
  if (pos >= str.size()) return false;
  long long value = 0;
  for (; pos < str.size(); ++pos) {
    char chr = str[pos];
    if (chr < '0' || chr > '9') return false;
    value = value * 10 + (chr - '0');
    if (value > static_cast<long long>(INT_MAX) + 1) return false;
  }
  if (negative) value = -value;
  if (value < INT_MIN || value > INT_MAX) return false;
  out = static_cast<int>(value);
  return true;
}

}  // namespace

PitchNotation parsePitch(const std::string& str) {
  if (str.empty() || str[0] < 'A' || str[0] > 'G') {
    throw ParseError(str, kPitchGrammar);
  }
  PitchNotation result;
  result.fifths = lof::fifthsFromLetter(str[0]);

  size_t pos = 1;
  AccidentalKind first = AccidentalKind::None;
  int count = 0;
  while (true) {
    size_t probe = pos;
    AccidentalKind kind = matchAccidental(str, probe);
    if (kind == AccidentalKind::None) break;
    if (first == AccidentalKind::None) {
      first = kind;
    } else if (kind != first) {
      throw ParseError(str, kPitchGrammar);  // mixed accidentals
    }
    ++count;
    pos = probe;
  }
  bool sharp = first == AccidentalKind::AsciiSharp || first == AccidentalKind::UnicodeSharp;
  result.fifths += (sharp ? 1 : -1) * lof::kFifthsPerAccidental * count;

  if (pos < str.size()) {
    int octave = 0;
    if (!scanSignedInt(str, pos, octave)) throw ParseError(str, kPitchGrammar);
    result.octave = octave;
  }
  return result;
}

IntervalNotation parseInterval(const std::string& str) {
  IntervalNotation result;
  size_t pos = 0;
  if (pos < str.size() && (str[pos] == '-' || str[pos] == '+')) {
    result.sign = str[pos] == '-' ? -1 : 1;
    ++pos;
  }

  // Quality: P, M, m, a+, d+ or empty.
  char quality = '\0';
  int repeats = 0;
  if (pos < str.size() && (str[pos] == 'P' || str[pos] == 'M' || str[pos] == 'm')) {
    quality = str[pos];
    repeats = 1;
    ++pos;
  } else if (pos < str.size() && (str[pos] == 'a' || str[pos] == 'd')) {
    quality = str[pos];
    while (pos < str.size() && str[pos] == quality) {
      ++repeats;
      ++pos;
    }
  }

  // Generic interval number 1-7.
  if (pos >= str.size() || str[pos] < '1' || str[pos] > '7') {
    throw ParseError(str, kIntervalGrammar);
  }
  int generic = str[pos] - '0';
  ++pos;

  bool perfect = lof::isPerfectGeneric(generic);
  switch (quality) {
    case 'P':
      if (!perfect) throw ParseError(str, kIntervalGrammar);
      break;
    case '\0':
    case 'M':
    case 'm':
      if (perfect) throw ParseError(str, kIntervalGrammar);
      break;
    default:
      break;
  }

  result.fifths = lof::fifthsFromGeneric(generic);
  if (quality == 'm') {
    result.fifths -= lof::kFifthsPerAccidental;
  } else if (quality == 'a') {
    result.fifths += lof::kFifthsPerAccidental * repeats;
  } else if (quality == 'd') {
    int steps = perfect ? repeats : repeats + 1;
    result.fifths -= lof::kFifthsPerAccidental * steps;
  }

  if (pos < str.size()) {
    if (str[pos] != ':') throw ParseError(str, kIntervalGrammar);
    int octave = 0;
    if (!scanSignedInt(str, pos + 1, octave)) throw ParseError(str, kIntervalGrammar);
    result.octave = octave;
  }
  return result;
}

bool looksLikePitch(const std::string& str) {
  return !str.empty() && str[0] >= 'A' && str[0] <= 'G';
}

std::string formatPitch(int fifths, std::optional<int> octave) {
  std::string name = lof::pitchClassName(fifths);
  if (octave) name += std::to_string(*octave);
  return name;
}

}  // namespace notation
}  // namespace pitchtypes

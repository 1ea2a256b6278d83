/// @file
/// @brief Line-of-fifths naming tables and inverse lookups.

#include "core/line_of_fifths.h"

#include <cstdlib>

#include "core/errors.h"

namespace pitchtypes {
namespace lof {

/// @brief Natural letters ordered along the line of fifths, starting at F (-1).
static constexpr char kLettersByFifths[7] = {'F', 'C', 'G', 'D', 'A', 'E', 'B'};

/// @brief Qualities for fifths -5..5 (m2 at -5 .. M7 at 5).
static constexpr char kCoreQualities[11] = {'m', 'm', 'm', 'm', 'P', 'P',
                                            'P', 'M', 'M', 'M', 'M'};

std::string pitchClassName(int fifths) {
  std::string name(1, kLettersByFifths[floorMod(fifths + 1, 7)]);
  int acc = accidentals(fifths);
  name.append(static_cast<size_t>(std::abs(acc)), acc > 0 ? '#' : 'b');
  return name;
}

std::string intervalQuality(int fifths) {
  if (fifths >= -5 && fifths <= 5) {
    return std::string(1, kCoreQualities[fifths + 5]);
  }
  if (fifths > 5) {
    return std::string(static_cast<size_t>(floorDiv(fifths + 1, 7)), 'a');
  }
  return std::string(static_cast<size_t>(floorDiv(-fifths + 1, 7)), 'd');
}

std::string intervalClassName(int fifths, bool inverse) {
  if (inverse) fifths = -fifths;
  return intervalQuality(fifths) + std::to_string(genericIntervalNumber(fifths));
}

int fifthsFromLetter(char letter) {
  for (int idx = 0; idx < 7; ++idx) {
    if (kLettersByFifths[idx] == letter) return idx - 1;
  }
  throw DomainError(std::string("diatonic pitch class must be one of A-G, got '") + letter + "'");
}

int fifthsFromGeneric(int generic) {
  if (generic < 1 || generic > 7) {
    throw DomainError("generic interval must be an integer between 1 and 7, got " +
                      std::to_string(generic));
  }
  return floorMod(2 * generic - 1, 7) - 1;
}

}  // namespace lof
}  // namespace pitchtypes

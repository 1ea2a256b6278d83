/// @file
/// @brief Display names for value families and kinds.

#include "core/value_kind.h"

namespace pitchtypes {

const char* familyToString(Family family) {
  switch (family) {
    case Family::Spelled:    return "Spelled";
    case Family::Enharmonic: return "Enharmonic";
    case Family::LogFreq:    return "LogFreq";
  }
  return "Unknown";
}

const char* kindToString(Kind kind) {
  switch (kind) {
    case Kind::Pitch:         return "Pitch";
    case Kind::Interval:      return "Interval";
    case Kind::PitchClass:    return "PitchClass";
    case Kind::IntervalClass: return "IntervalClass";
  }
  return "Unknown";
}

std::string typeName(TypeId type) {
  return std::string(familyToString(type.family)) + kindToString(type.kind);
}

}  // namespace pitchtypes

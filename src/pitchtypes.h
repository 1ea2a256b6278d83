// pitchtypes -- umbrella header for the pitch and interval value types,
// their algebra and cross-family conversion.

#ifndef PITCHTYPES_PITCHTYPES_H
#define PITCHTYPES_PITCHTYPES_H

#include "convert/any_value.h"
#include "convert/convert.h"
#include "convert/converter_registry.h"
#include "convert/converters.h"
#include "core/algebra.h"
#include "core/errors.h"
#include "core/line_of_fifths.h"
#include "core/notation.h"
#include "core/print_options.h"
#include "core/value_kind.h"
#include "enharmonic/enharmonic.h"
#include "logfreq/logfreq.h"
#include "spelled/spelled.h"

#endif  // PITCHTYPES_PITCHTYPES_H

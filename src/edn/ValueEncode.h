#ifndef EDNKIT_EDN_VALUEENCODE_H
#define EDNKIT_EDN_VALUEENCODE_H

#include "EdnEncode.h"
#include "Value.h"

namespace ednkit::edn {

Generator::Result encode_value(Generator &gen, const Value &value);

/// Encodes `value` as one complete document into `sink`.
[[nodiscard]] Result<void> write_value(OutputSink &sink, const Value &value, bool pretty);

} // namespace ednkit::edn

#endif // EDNKIT_EDN_VALUEENCODE_H

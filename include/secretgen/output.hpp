#pragma once

#include <ostream>
#include <string>

#include "secretgen/clipboard.hpp"
#include "secretgen/json.hpp"

namespace secretgen {

struct OutputMode {
    bool json = false;
    bool quiet = false;
};

// {"value": value, "meta": meta}
JsonValue BuildEnvelope(const std::string& value, const JsonValue& meta);

// Prints the value (or its envelope) on one line, then mirrors the plain value to
// the clipboard when requested. Clipboard failure is only a warning on err.
void PrintValue(
    const std::string& value,
    const JsonValue& meta,
    const OutputMode& mode,
    bool copy_requested,
    IClipboardSink* clipboard,
    std::ostream& out,
    std::ostream& err);

}  // namespace secretgen

#include "secretgen/output.hpp"

namespace secretgen {

JsonValue BuildEnvelope(const std::string& value, const JsonValue& meta) {
    JsonValue envelope = JsonValue::Object();
    envelope.Set("value", JsonValue::String(value));
    envelope.Set("meta", meta);
    return envelope;
}

void PrintValue(
    const std::string& value,
    const JsonValue& meta,
    const OutputMode& mode,
    const bool copy_requested,
    IClipboardSink* clipboard,
    std::ostream& out,
    std::ostream& err) {
    if (mode.json) {
        out << SerializeJson(BuildEnvelope(value, meta)) << "\n";
    } else {
        out << value << "\n";
    }
    out.flush();

    if (!copy_requested) {
        return;
    }
    const GenStatus status = clipboard == nullptr ? GenStatus::ClipboardError : clipboard->Copy(value);
    if (status != GenStatus::Ok) {
        err << "Warning: " << Describe(status) << "\n";
    }
}

}  // namespace secretgen

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "secretgen/gen_status.hpp"

namespace secretgen {

class IClipboardSink {
public:
    virtual ~IClipboardSink() = default;

    virtual GenStatus Copy(std::string_view text) = 0;
};

// Pipes the text into the first clipboard helper found on PATH
// (wl-copy, xclip, xsel, pbcopy).
class SystemClipboard final : public IClipboardSink {
public:
    GenStatus Copy(std::string_view text) override;

    // Shell command lines tried in order for the current session.
    static std::vector<std::string> CandidateCommands();

private:
    static bool ExecutableOnPath(const std::string& program);
    static GenStatus PipeTo(const std::string& command, std::string_view text);
};

}  // namespace secretgen

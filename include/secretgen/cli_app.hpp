#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "secretgen/clipboard.hpp"
#include "secretgen/gen_status.hpp"
#include "secretgen/random_source.hpp"

namespace secretgen {

using RandomSourceFactory = std::function<GenStatus(std::unique_ptr<IRandomSource>&)>;

// Process-level collaborators. The binary wires the real ones; tests swap in
// string streams, a fake clipboard and a deterministic random source.
struct CliEnvironment {
    CliEnvironment(std::ostream& out_stream, std::ostream& err_stream, std::istream& in_stream)
        : out(out_stream), err(err_stream), in(in_stream) {}

    std::ostream& out;
    std::ostream& err;
    std::istream& in;
    IClipboardSink* clipboard = nullptr;
    RandomSourceFactory make_random = SecureRandomSource::Create;
    // Empty means ProfileStore::DefaultPath().
    std::string profile_path;
};

// args excludes the program name. Returns the process exit code.
int RunCli(const std::vector<std::string>& args, CliEnvironment& env);

std::string VersionString();

}  // namespace secretgen

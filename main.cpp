#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "secretgen/cli_app.hpp"
#include "secretgen/clipboard.hpp"

namespace {

int RunCliMain(const int argc, char* argv[]) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0U);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    secretgen::SystemClipboard clipboard;
    secretgen::CliEnvironment env(std::cout, std::cerr, std::cin);
    env.clipboard = &clipboard;
    return secretgen::RunCli(args, env);
}

}  // namespace

int main(const int argc, char* argv[]) {
    return RunCliMain(argc, argv);
}

#include "secretgen/clipboard.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace secretgen {

namespace {

std::string ProgramOf(const std::string& command) {
    return command.substr(0, command.find(' '));
}

}  // namespace

GenStatus SystemClipboard::Copy(const std::string_view text) {
    for (const std::string& command : CandidateCommands()) {
        if (!ExecutableOnPath(ProgramOf(command))) {
            continue;
        }
        if (PipeTo(command, text) == GenStatus::Ok) {
            return GenStatus::Ok;
        }
    }
    return GenStatus::ClipboardError;
}

std::vector<std::string> SystemClipboard::CandidateCommands() {
    std::vector<std::string> commands;
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland != nullptr && wayland[0] != '\0') {
        commands.emplace_back("wl-copy");
    }
    const char* display = std::getenv("DISPLAY");
    if (display != nullptr && display[0] != '\0') {
        commands.emplace_back("xclip -selection clipboard");
        commands.emplace_back("xsel --clipboard --input");
    }
    commands.emplace_back("pbcopy");
    return commands;
}

bool SystemClipboard::ExecutableOnPath(const std::string& program) {
    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }
    std::stringstream entries(path);
    std::string dir;
    while (std::getline(entries, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

GenStatus SystemClipboard::PipeTo(const std::string& command, const std::string_view text) {
    const std::string quiet_command = command + " >/dev/null 2>&1";
    std::FILE* pipe = popen(quiet_command.c_str(), "w");
    if (pipe == nullptr) {
        return GenStatus::ClipboardError;
    }

    // A helper that exits early must not take the process down with SIGPIPE.
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous);

    const bool written = std::fwrite(text.data(), 1, text.size(), pipe) == text.size();
    const int status = pclose(pipe);

    sigaction(SIGPIPE, &previous, nullptr);

    if (!written || status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return GenStatus::ClipboardError;
    }
    return GenStatus::Ok;
}

}  // namespace secretgen
